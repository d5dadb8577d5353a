// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#include <catch.hpp>

#include "ConformanceSuite.h"
#include "FaultySerializers.h"

#include <limits>

using namespace Conformance;
using Catch::Matchers::Contains;

namespace
{
    /*!
     * Fixture of a default constructible serializer
     * @tparam S Serializer type
     */
    template<class S, class T = typename S::ValueType>
    class Fixture : public SerializerFixture<T>
    {
    public:
        Fixture(std::vector<T> testData, int length, bool snapshotRegistered = true) :
                testData(std::move(testData)), length(length), snapshotRegistered(snapshotRegistered)
        {}

        std::shared_ptr<TypeSerializer<T>> createSerializer() const override
        {
            return std::make_shared<S>();
        }

        int getLength() const override
        {
            return length;
        }

        std::vector<T> getTestData() const override
        {
            return testData;
        }

        void registerSnapshots(SnapshotRegistry &registry) const override
        {
            if (snapshotRegistered)
            {
                registry.registerFactory(S().snapshotConfiguration()->snapshotTypeId(), []()
                {
                    return std::unique_ptr<SnapshotBase>(S().snapshotConfiguration());
                });
            }
        }

    private:
        std::vector<T> testData;
        int length;
        bool snapshotRegistered;
    };

    const std::vector<int32_t> ints {0, 1, -1, std::numeric_limits<int32_t>::max()};

    class NullSerializerFixture : public Fixture<Samples::IntSerializer>
    {
    public:
        NullSerializerFixture() : Fixture(ints, 4)
        {}

        std::shared_ptr<TypeSerializer<int32_t>> createSerializer() const override
        {
            return nullptr;
        }
    };

    struct Square : public Samples::Shape
    {
        void print(std::ostream &out) const override
        {
            out << "Square";
        }
    };

    //! Requires instances to be squares, the serializer creates circles
    class SquareOnlyFixture : public Fixture<Samples::CircleSerializer>
    {
    public:
        SquareOnlyFixture() : Fixture({std::make_shared<Samples::Circle>(1.0)}, 8)
        {}

        bool isInstanceOfDeclaredType(const std::shared_ptr<Samples::Shape> &instance) const override
        {
            return dynamic_cast<const Square *>(instance.get()) != nullptr;
        }
    };

    class EmptyInstanceSerializer : public NullableSerializer<int32_t>
    {
    public:
        EmptyInstanceSerializer() : NullableSerializer(std::make_shared<Samples::IntSerializer>(), 4)
        {}

        std::optional<int32_t> createInstance() const override
        {
            return std::nullopt;
        }
    };

    class EmptyInstanceFixture : public Fixture<EmptyInstanceSerializer>
    {
    public:
        explicit EmptyInstanceFixture(bool allowNull) :
                Fixture({std::nullopt, 3, -3}, 5, false), allowNull(allowNull)
        {}

        bool allowNullInstances() const override
        {
            return allowNull;
        }

    private:
        bool allowNull;
    };
}

TEST_CASE("Faulty serializer detection test")
{
    SECTION("Stale reuse target")
    {
        Fixture<Faulty::StaleReuseSerializer> fixture({{}, {1, 2, 3}, {-5}}, -1);
        ConformanceSuite<std::vector<int64_t>> suite(fixture);
        REQUIRE_NOTHROW(suite.testCopy());
        REQUIRE_NOTHROW(suite.testCopyIntoNewElements());
        REQUIRE_THROWS_AS(suite.testCopyIntoReusedElements(), ContractViolation);
        REQUIRE_THROWS_WITH(suite.testCopyIntoReusedElements(),
                            Contains("[copy into reused elements]") && Contains("Expected: [-5] Actual: [1, 2, 3]"));
    }
    SECTION("Trailing bytes")
    {
        Fixture<Faulty::TrailingBytesSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testSerializeIndividually(), ContractViolation);
        REQUIRE_THROWS_AS(suite.testSerializeIndividuallyReusingValues(), ContractViolation);
        REQUIRE_THROWS_AS(suite.testSerializeAsSequenceNoReuse(), ContractViolation);
    }
    SECTION("Wrong length")
    {
        Fixture<Faulty::WrongLengthSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testGetLength(), ContractViolation);

        auto report = suite.runAll();
        REQUIRE_FALSE(report.passed());
        REQUIRE(report.failureCount() == 2);
        REQUIRE_FALSE(report.find("get length")->passed);
        REQUIRE_FALSE(report.find("nullability")->passed);
        REQUIRE_THAT(report.find("get length")->message, Contains("Serializer reports length 8, expected 4"));
    }
    SECTION("Zero declared length")
    {
        Fixture<Samples::IntSerializer> fixture(ints, 0);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testGetLength(), FixtureError);
    }
    SECTION("Broken raw copy")
    {
        Fixture<Faulty::BrokenRawCopySerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testSerializedCopyIndividually(), ContractViolation);
        REQUIRE_THROWS_AS(suite.testSerializedCopyAsSequence(), ContractViolation);
    }
    SECTION("Incompatible snapshot")
    {
        Fixture<Faulty::IncompatibleSnapshotSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_NOTHROW(suite.testConfigSnapshotInstantiation());
        REQUIRE_THROWS_WITH(suite.testSnapshotConfigurationAndReconfigure(),
                            Contains("SchemaCompatibility{INCOMPATIBLE}"));
    }
    SECTION("Clone not equal to the original")
    {
        Fixture<Faulty::IdentitySerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testSerializabilityAndEquals(), ContractViolation);
    }
    SECTION("Unregistered snapshot")
    {
        Fixture<Samples::IntSerializer> fixture(ints, 4, false);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_AS(suite.testSerializabilityAndEquals(), CloneError);
        REQUIRE_THROWS_AS(suite.testConfigSnapshotInstantiation(), ContractViolation);
    }
    SECTION("Duplicates sharing state")
    {
        Fixture<Faulty::SharedScratchSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_NOTHROW(suite.testSerializeIndividually());
        REQUIRE_THROWS_AS(suite.testDuplicate(), ConcurrentFailure);
    }
    SECTION("Exception escaping the serializer")
    {
        Fixture<Samples::StringSerializer> strings({"fits"}, -1);
        ConformanceSuite<std::string> suite(strings);
        REQUIRE_NOTHROW(suite.testSerializeIndividually());

        struct TinyStringFixture : public SerializerFixture<std::string>
        {
            std::shared_ptr<TypeSerializer<std::string>> createSerializer() const override
            {
                return std::make_shared<Samples::BoundedStringSerializer>(2);
            }

            int getLength() const override
            {
                return -1;
            }

            std::vector<std::string> getTestData() const override
            {
                return {"too long"};
            }

            void registerSnapshots(SnapshotRegistry &registry) const override
            {
                registry.registerSnapshot<Samples::BoundedStringSerializerSnapshot>();
            }
        } tiny;
        ConformanceSuite<std::string> tinySuite(tiny);
        try
        {
            tinySuite.testSerializeIndividually();
            FAIL("Exception of the serializer was not reported");
        }
        catch (const ContractViolation &e)
        {
            REQUIRE(e.property() == "serialize individually");
            REQUIRE_THROWS_AS(std::rethrow_if_nested(e), SerializationError);
            REQUIRE_THAT(describeException(e), Contains("exceeds the limit of 2"));
        }
    }
    SECTION("Instance of another type")
    {
        SquareOnlyFixture fixture;
        ConformanceSuite<std::shared_ptr<Samples::Shape>> suite(fixture);
        REQUIRE_THROWS_AS(suite.testInstantiate(), ContractViolation);
        REQUIRE_THROWS_WITH(suite.testInstantiate(), Contains("[instantiate]") &&
                                                     Contains("Type of the instantiated object is wrong") &&
                                                     Contains(typeid(Samples::Circle).name()));
    }
    SECTION("Nothing written")
    {
        Fixture<Faulty::SilentSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        REQUIRE_THROWS_WITH(suite.testSerializeIndividually(),
                            Contains("[serialize individually]") && Contains("No data available"));
        REQUIRE_THROWS_WITH(suite.testSerializeIndividuallyReusingValues(), Contains("No data available"));
        REQUIRE_THROWS_WITH(suite.testSerializeAsSequenceNoReuse(),
                            Contains("Wrong number of elements deserialized. Expected: 4 Actual: 0"));
    }
    SECTION("Element count not preserved")
    {
        Fixture<Faulty::GreedyReadSerializer> greedy({7, 7, 7, 7}, 4);
        ConformanceSuite<int32_t> fewer(greedy);
        REQUIRE_THROWS_AS(fewer.testSerializeAsSequenceNoReuse(), ContractViolation);
        REQUIRE_THROWS_WITH(fewer.testSerializeAsSequenceNoReuse(),
                            Contains("Wrong number of elements deserialized. Expected: 4 Actual: 2"));
        REQUIRE_THROWS_WITH(fewer.testSerializeAsSequenceReusingValues(),
                            Contains("Wrong number of elements deserialized. Expected: 4 Actual: 2"));

        Fixture<Faulty::DoubleWriteSerializer> doubled({7, 7}, 4);
        ConformanceSuite<int32_t> more(doubled);
        REQUIRE_THROWS_AS(more.testSerializeAsSequenceNoReuse(), ContractViolation);
        REQUIRE_THROWS_WITH(more.testSerializeAsSequenceNoReuse(),
                            Contains("More elements deserialized than the 2 serialized ones."));
    }
    SECTION("Duplication throwing")
    {
        Fixture<Faulty::ThrowingDuplicateSerializer> fixture(ints, 4);
        ConformanceSuite<int32_t> suite(fixture);
        try
        {
            suite.testDuplicate();
            FAIL("Exception of duplicate() was not reported");
        }
        catch (const ContractViolation &e)
        {
            REQUIRE(e.property() == "duplicate");
            REQUIRE_THROWS_AS(std::rethrow_if_nested(e), std::runtime_error);
            REQUIRE_THAT(describeException(e), Contains("cannot be duplicated again"));
        }
    }
    SECTION("Null instances")
    {
        EmptyInstanceFixture rejecting(false);
        REQUIRE_THROWS_AS(ConformanceSuite<std::optional<int32_t>>(rejecting).testInstantiate(), ContractViolation);

        EmptyInstanceFixture allowing(true);
        ConformanceSuite<std::optional<int32_t>> suite(allowing);
        REQUIRE_NOTHROW(suite.testInstantiate());
        REQUIRE_NOTHROW(suite.testCopyIntoNewElements());
        REQUIRE_NOTHROW(suite.testSerializeIndividually());
        REQUIRE_NOTHROW(suite.testSerializeAsSequenceReusingValues());
    }
    SECTION("Missing comparator")
    {
        Fixture<Samples::PointSerializer> fixture({{1, 2}}, 16);
        ConformanceSuite<Samples::Point> suite(fixture);
        REQUIRE_THROWS_AS(suite.testCopy(), FixtureError);
    }
    SECTION("Unusable fixture")
    {
        Fixture<Samples::IntSerializer> empty({}, 4);
        REQUIRE_THROWS_AS(ConformanceSuite<int32_t>(empty), FixtureError);

        NullSerializerFixture nullSerializer;
        ConformanceSuite<int32_t> suite(nullSerializer);
        REQUIRE_THROWS_AS(suite.testCopy(), FixtureError);
        auto report = suite.runAll();
        REQUIRE(report.failureCount() == report.results.size());
    }
}
