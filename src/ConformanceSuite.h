// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_CONFORMANCESUITE_H
#define CONFORMANCE_CONFORMANCESUITE_H


#include "ByteChannel.h"
#include "ConformanceErrors.h"
#include "DeepEquals.h"
#include "DuplicationRunner.h"
#include "NullableSerializer.h"
#include "SerializerFixture.h"
#include "SnapshotIO.h"
#include "TypeSerializer.h"

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace Conformance
{
    //! Named check of a conformance suite
    struct Property
    {
        std::string name;
        std::function<void()> check;
    };

    //! Outcome of a single property
    struct PropertyResult
    {
        std::string name;
        bool passed;
        std::string message;        ///<Flattened failure, empty if passed
    };

    //! Outcome of running every property of a suite
    struct SuiteReport
    {
        std::vector<PropertyResult> results;

        bool passed() const
        {
            return failureCount() == 0;
        }

        size_t failureCount() const
        {
            size_t count = 0;
            for (const auto &result : results)
            {
                count += result.passed ? 0 : 1;
            }
            return count;
        }

        //! @return Result of the named property or nullptr
        const PropertyResult *find(const std::string &name) const
        {
            for (const auto &result : results)
            {
                if (result.name == name)
                {
                    return &result;
                }
            }
            return nullptr;
        }
    };

    //! Run a single property, its failure is captured in the result
    inline PropertyResult runProperty(const Property &property)
    {
        PropertyResult result{property.name, true, std::string()};
        try
        {
            property.check();
        }
        catch (const std::exception &e)
        {
            result.passed = false;
            result.message = describeException(e);
        }
        catch (...)
        {
            result.passed = false;
            result.message = "unknown exception";
        }
        return result;
    }

    /*!
     * Conformance checks of a serializer described by a fixture
     *
     * Every check is independent and throws a ConformanceError subclass on the first broken expectation.
     * Every deserialized or copied value is also passed through describe(), which reveals values that
     * compare equal while being internally inconsistent.
     * @tparam T Type of serialized values
     */
    template<class T>
    class ConformanceSuite
    {
    public:
        /*!
         * @param fixture Fixture, must outlive the suite
         * @param checker Equality checker, extended with the comparators the fixture registers
         * @param options Run time settings
         * @throws FixtureError if the fixture provides no test data or options are unusable
         */
        ConformanceSuite(const SerializerFixture<T> &fixture, DeepEqualsChecker checker,
                         SuiteOptions options = SuiteOptions()) :
                fixture(fixture), checker(std::move(checker)), options(options), testData(fixture.getTestData())
        {
            if (testData.empty())
            {
                throw FixtureError("fixture", "Test case corrupt. Returns no test data.");
            }
            if (options.workerCount == 0 || options.duration.count() <= 0)
            {
                throw FixtureError("fixture", "Duplication check needs at least one worker and a positive duration");
            }
            fixture.registerComparators(this->checker);
            fixture.registerSnapshots(registry);
        }

        explicit ConformanceSuite(const SerializerFixture<T> &fixture, SuiteOptions options = SuiteOptions()) :
                ConformanceSuite(fixture, DeepEqualsChecker(), options)
        {}

        ConformanceSuite(const ConformanceSuite &) = delete;
        ConformanceSuite &operator=(const ConformanceSuite &) = delete;

        void testInstantiate() const
        {
            static const char *property = "instantiate";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                T instance = serializer->createInstance();
                if (valueTraits::isNullValue(instance))
                {
                    if (fixture.allowNullInstances())
                    {
                        return;
                    }
                    throw ContractViolation(property, "The created instance must not be null.");
                }
                if (!fixture.isInstanceOfDeclaredType(instance))
                {
                    throw ContractViolation(property, fmt::format(
                            "Type of the instantiated object is wrong. Expected Type: {} present type {}",
                            valueTraits::declaredTypeIndex<T>().name(),
                            valueTraits::runtimeTypeIndex(instance).name()));
                }
                describe(instance);
            });
        }

        void testConfigSnapshotInstantiation() const
        {
            static const char *property = "config snapshot instantiation";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                auto snapshot = serializer->snapshotConfiguration();
                if (!snapshot)
                {
                    throw ContractViolation(property, "Serializer returned null configuration snapshot.");
                }
                auto instance = registry.instantiateFor<T>(snapshot->snapshotTypeId());
                if (typeid(*instance) != typeid(*snapshot))
                {
                    throw ContractViolation(property, fmt::format(
                            "Snapshot type id \"{}\" instantiates {} instead of {}", snapshot->snapshotTypeId(),
                            typeid(*instance).name(), typeid(*snapshot).name()));
                }
            });
        }

        void testSnapshotConfigurationAndReconfigure() const
        {
            static const char *property = "snapshot configuration and reconfigure";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                auto snapshot = serializer->snapshotConfiguration();
                if (!snapshot)
                {
                    throw ContractViolation(property, "Serializer returned null configuration snapshot.");
                }

                OutputChannel out;
                writeSerializerSnapshot(out, *snapshot);
                auto in = out.getInputView();
                auto restoredConfig = readSerializerSnapshot<T>(in, registry);
                checkFullyConsumed(property, in, "Trailing data available after reading the snapshot.");

                auto strategy = restoredConfig->resolveSchemaCompatibility(*getSerializer(property));
                std::shared_ptr<TypeSerializer<T>> restoreSerializer;
                if (strategy.isCompatibleAsIs())
                {
                    restoreSerializer = restoredConfig->restoreSerializer();
                }
                else if (strategy.isCompatibleWithReconfiguredSerializer())
                {
                    restoreSerializer = strategy.getReconfiguredSerializer();
                }
                else
                {
                    throw ContractViolation(property, "Unable to restore serializer with " + strategy.describe());
                }

                if (!restoreSerializer)
                {
                    throw ContractViolation(property, "Restored serializer is null with " + strategy.describe());
                }
                if (typeid(*restoreSerializer) != typeid(*serializer))
                {
                    throw ContractViolation(property, fmt::format("Restored serializer is a {}, expected {}",
                                                                  typeid(*restoreSerializer).name(),
                                                                  typeid(*serializer).name()));
                }
                if (*restoreSerializer != *serializer)
                {
                    throw ContractViolation(property, "Restored serializer is configured differently than the "
                                                      "original one with " + strategy.describe());
                }
            });
        }

        void testGetLength() const
        {
            static const char *property = "get length";
            const int len = fixture.getLength();
            if (len == 0)
            {
                throw FixtureError(property, "Broken serializer test base - zero length cannot be the expected "
                                             "length");
            }
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                if (serializer->getLength() != len)
                {
                    throw ContractViolation(property, fmt::format("Serializer reports length {}, expected {}",
                                                                  serializer->getLength(), len));
                }
            });
        }

        void testCopy() const
        {
            static const char *property = "copy";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                for (const auto &datum : testData)
                {
                    T copy = serializer->copy(datum);
                    deepEquals(property, "Copied element is not equal to the original element.", datum, copy);
                }
            });
        }

        void testCopyIntoNewElements() const
        {
            static const char *property = "copy into new elements";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                for (const auto &datum : testData)
                {
                    T target = serializer->createInstance();
                    const T &copy = serializer->copy(datum, target);
                    deepEquals(property, "Copied element is not equal to the original element.", datum, copy);
                }
            });
        }

        void testCopyIntoReusedElements() const
        {
            static const char *property = "copy into reused elements";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                T target = serializer->createInstance();
                for (const auto &datum : testData)
                {
                    const T &copy = serializer->copy(datum, target);
                    deepEquals(property, "Copied element is not equal to the original element.", datum, copy);
                }
            });
        }

        void testSerializeIndividually() const
        {
            static const char *property = "serialize individually";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                for (const auto &value : testData)
                {
                    OutputChannel out;
                    serializer->serialize(value, out);
                    auto in = out.getInputView();
                    checkDataAvailable(property, in, "No data available during deserialization.");

                    T target = serializer->createInstance();
                    const T &deserialized = serializer->deserialize(target, in);
                    deepEquals(property, "Deserialized value is wrong.", value, deserialized);
                    checkFullyConsumed(property, in, "Trailing data available after deserialization.");
                }
            });
        }

        void testSerializeIndividuallyReusingValues() const
        {
            static const char *property = "serialize individually reusing values";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                T reuseValue = serializer->createInstance();
                for (const auto &value : testData)
                {
                    OutputChannel out;
                    serializer->serialize(value, out);
                    auto in = out.getInputView();
                    checkDataAvailable(property, in, "No data available during deserialization.");

                    const T &deserialized = serializer->deserialize(reuseValue, in);
                    deepEquals(property, "Deserialized value is wrong.", value, deserialized);
                    checkFullyConsumed(property, in, "Trailing data available after deserialization.");
                }
            });
        }

        void testSerializeAsSequenceNoReuse() const
        {
            static const char *property = "serialize as sequence no reuse";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                OutputChannel out;
                for (const auto &value : testData)
                {
                    serializer->serialize(value, out);
                }

                auto in = out.getInputView();
                size_t num = 0;
                while (in.available() > 0)
                {
                    checkNotTooMany(property, num);
                    T deserialized = serializer->deserialize(in);
                    deepEquals(property, "Deserialized value is wrong.", testData[num], deserialized);
                    num++;
                }
                checkCount(property, num, "Wrong number of elements deserialized.");
            });
        }

        void testSerializeAsSequenceReusingValues() const
        {
            static const char *property = "serialize as sequence reusing values";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                OutputChannel out;
                for (const auto &value : testData)
                {
                    serializer->serialize(value, out);
                }

                auto in = out.getInputView();
                T reuseValue = serializer->createInstance();
                size_t num = 0;
                while (in.available() > 0)
                {
                    checkNotTooMany(property, num);
                    const T &deserialized = serializer->deserialize(reuseValue, in);
                    deepEquals(property, "Deserialized value is wrong.", testData[num], deserialized);
                    num++;
                }
                checkCount(property, num, "Wrong number of elements deserialized.");
            });
        }

        void testSerializedCopyIndividually() const
        {
            static const char *property = "serialized copy individually";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                for (const auto &value : testData)
                {
                    OutputChannel out;
                    serializer->serialize(value, out);

                    auto source = out.getInputView();
                    OutputChannel target;
                    serializer->copy(source, target);
                    checkFullyConsumed(property, source, "Trailing data left in the source after copying.");

                    auto toVerify = target.getInputView();
                    checkDataAvailable(property, toVerify, "No data available copying.");

                    T reuse = serializer->createInstance();
                    const T &deserialized = serializer->deserialize(reuse, toVerify);
                    deepEquals(property, "Deserialized value is wrong.", value, deserialized);
                    checkFullyConsumed(property, toVerify, "Trailing data available after deserialization.");
                }
            });
        }

        void testSerializedCopyAsSequence() const
        {
            static const char *property = "serialized copy as sequence";
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                OutputChannel out;
                for (const auto &value : testData)
                {
                    serializer->serialize(value, out);
                }

                auto source = out.getInputView();
                OutputChannel target;
                for (size_t i = 0; i < testData.size(); ++i)
                {
                    serializer->copy(source, target);
                }
                checkFullyConsumed(property, source, "Trailing data left in the source after copying.");

                auto toVerify = target.getInputView();
                size_t num = 0;
                while (toVerify.available() > 0)
                {
                    checkNotTooMany(property, num);
                    T reuse = serializer->createInstance();
                    const T &deserialized = serializer->deserialize(reuse, toVerify);
                    deepEquals(property, "Deserialized value is wrong.", testData[num], deserialized);
                    num++;
                }
                checkCount(property, num, "Wrong number of elements copied.");
            });
        }

        void testSerializabilityAndEquals() const
        {
            static const char *property = "serializability and equals";
            auto ser1 = getSerializer(property);
            std::shared_ptr<TypeSerializer<T>> ser2;
            try
            {
                ser2 = cloneSerializer(*ser1, registry);
            }
            catch (const std::exception &e)
            {
                std::throw_with_nested(CloneError(property, fmt::format("The serializer is not serializable: {}",
                                                                        e.what())));
            }
            guard(property, [&]
            {
                if (typeid(*ser1) != typeid(*ser2) || *ser1 != *ser2)
                {
                    throw ContractViolation(property, "The copy of the serializer is not equal to the original one.");
                }
            });
        }

        void testNullability() const
        {
            static const char *property = "nullability";
            auto serializer = getSerializer(property);
            try
            {
                checkIfNullSupported(*serializer, testData, checker);
            }
            catch (const std::exception &e)
            {
                std::throw_with_nested(ContractViolation(property, fmt::format(
                        "Unexpected failure of null value handling: {}", e.what())));
            }
        }

        void testDuplicate() const
        {
            static const char *property = DuplicationRunner<T>::Property;
            auto serializer = getSerializer(property);
            guard(property, [&]
            {
                auto duplicate = serializer->duplicate();
                if (!duplicate)
                {
                    throw ContractViolation(property, "duplicate() returned null");
                }
                if (*duplicate != *serializer)
                {
                    throw ContractViolation(property, "Duplicate is not equal to the original serializer.");
                }
                DuplicationRunner<T>(serializer, testData, checker, options).run();
            });
        }

        //! Every check with the name it is reported under
        std::vector<Property> properties() const
        {
            return {
                    {"instantiate",                            [this] { testInstantiate(); }},
                    {"config snapshot instantiation",          [this] { testConfigSnapshotInstantiation(); }},
                    {"snapshot configuration and reconfigure", [this] { testSnapshotConfigurationAndReconfigure(); }},
                    {"get length",                             [this] { testGetLength(); }},
                    {"copy",                                   [this] { testCopy(); }},
                    {"copy into new elements",                 [this] { testCopyIntoNewElements(); }},
                    {"copy into reused elements",              [this] { testCopyIntoReusedElements(); }},
                    {"serialize individually",                 [this] { testSerializeIndividually(); }},
                    {"serialize individually reusing values",  [this] { testSerializeIndividuallyReusingValues(); }},
                    {"serialize as sequence no reuse",         [this] { testSerializeAsSequenceNoReuse(); }},
                    {"serialize as sequence reusing values",   [this] { testSerializeAsSequenceReusingValues(); }},
                    {"serialized copy individually",           [this] { testSerializedCopyIndividually(); }},
                    {"serialized copy as sequence",            [this] { testSerializedCopyAsSequence(); }},
                    {"serializability and equals",             [this] { testSerializabilityAndEquals(); }},
                    {"nullability",                            [this] { testNullability(); }},
                    {"duplicate",                              [this] { testDuplicate(); }},
            };
        }

        /*!
         * Run every property, a failing property does not stop the others
         * @note Failures are also printed to stderr
         */
        SuiteReport runAll() const
        {
            SuiteReport report;
            for (const auto &property : properties())
            {
                auto result = runProperty(property);
                if (!result.passed)
                {
                    fmt::print(stderr, "Property \"{}\" failed: {}\n", result.name, result.message);
                }
                report.results.push_back(std::move(result));
            }
            return report;
        }

        const std::vector<T> &getTestData() const noexcept
        {
            return testData;
        }

        const DeepEqualsChecker &getChecker() const noexcept
        {
            return checker;
        }

    private:
        std::shared_ptr<TypeSerializer<T>> getSerializer(const char *property) const
        {
            auto serializer = fixture.createSerializer();
            if (!serializer)
            {
                throw FixtureError(property, "Test case corrupt. Returns null as serializer.");
            }
            return serializer;
        }

        // Serializer exceptions become contract violations, harness failures pass through
        template<class Check>
        void guard(const char *property, Check &&check) const
        {
            try
            {
                check();
            }
            catch (const ConformanceError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                std::throw_with_nested(ContractViolation(property, fmt::format("Exception in test: {}", e.what())));
            }
            catch (...)
            {
                std::throw_with_nested(ContractViolation(property, "Exception in test: unknown exception"));
            }
        }

        void deepEquals(const char *property, const char *message, const T &should, const T &is) const
        {
            auto representation = describe(is);
            if (!checker.equals(should, is))
            {
                throw ContractViolation(property, fmt::format("{} Expected: {} Actual: {}", message, describe(should),
                                                              representation));
            }
        }

        static void checkDataAvailable(const char *property, const InputChannel &in, const char *message)
        {
            if (in.available() == 0)
            {
                throw ContractViolation(property, message);
            }
        }

        static void checkFullyConsumed(const char *property, const InputChannel &in, const char *message)
        {
            if (in.available() != 0)
            {
                throw ContractViolation(property, fmt::format("{} {} bytes left.", message, in.available()));
            }
        }

        void checkNotTooMany(const char *property, size_t num) const
        {
            if (num >= testData.size())
            {
                throw ContractViolation(property, fmt::format(
                        "More elements deserialized than the {} serialized ones.", testData.size()));
            }
        }

        void checkCount(const char *property, size_t num, const char *message) const
        {
            if (num != testData.size())
            {
                throw ContractViolation(property, fmt::format("{} Expected: {} Actual: {}", message, testData.size(),
                                                              num));
            }
        }

        const SerializerFixture<T> &fixture;
        DeepEqualsChecker checker;
        SnapshotRegistry registry;
        SuiteOptions options;
        const std::vector<T> testData;
    };

    /*!
     * Create a suite deducing the value type from the fixture
     */
    template<class T>
    ConformanceSuite<T> makeSuite(const SerializerFixture<T> &fixture, SuiteOptions options = SuiteOptions())
    {
        return ConformanceSuite<T>(fixture, options);
    }
}

#endif //CONFORMANCE_CONFORMANCESUITE_H
