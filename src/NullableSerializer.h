// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_NULLABLESERIALIZER_H
#define CONFORMANCE_NULLABLESERIALIZER_H


#include "ByteChannel.h"
#include "DeepEquals.h"
#include "SnapshotIO.h"
#include "TypeSerializer.h"

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace Conformance
{
    template<class T>
    class NullableSerializerSnapshot;

    /*!
     * Serializer of optional values on top of a serializer of T
     *
     * Every value is prefixed with a null flag. If padding is set a null value is followed by that many zero bytes,
     * which keeps the length of a fixed length serializer fixed.
     * @tparam T Type of values serialized by the wrapped serializer
     */
    template<class T>
    class NullableSerializer : public TypeSerializer<std::optional<T>>
    {
    public:
        typedef std::optional<T> Value;

        NullableSerializer(std::shared_ptr<TypeSerializer<T>> original, int padding) :
                original(std::move(original)), padding(padding)
        {
            if (!this->original)
            {
                throw std::invalid_argument("Wrapped serializer must not be null");
            }
            if (padding < 0)
            {
                throw std::invalid_argument("Null value padding must not be negative");
            }
        }

        /*!
         * Wrap a serializer
         * @param original Serializer of non null values
         * @param padNullValueIfFixedLen Pad null values to the wrapped serializer length if it is fixed
         */
        static std::shared_ptr<NullableSerializer<T>> wrap(std::shared_ptr<TypeSerializer<T>> original,
                                                           bool padNullValueIfFixedLen)
        {
            if (!original)
            {
                throw std::invalid_argument("Wrapped serializer must not be null");
            }
            int padding = padNullValueIfFixedLen && original->getLength() > 0 ? original->getLength() : 0;
            return std::make_shared<NullableSerializer<T>>(std::move(original), padding);
        }

        const std::shared_ptr<TypeSerializer<T>> &originalSerializer() const noexcept
        {
            return original;
        }

        int nullPaddingLength() const noexcept
        {
            return padding;
        }

        std::shared_ptr<TypeSerializer<Value>> duplicate() override
        {
            return std::make_shared<NullableSerializer<T>>(original->duplicate(), padding);
        }

        Value createInstance() const override
        {
            return original->createInstance();
        }

        Value copy(const Value &from) override
        {
            if (!from)
            {
                return std::nullopt;
            }
            return original->copy(*from);
        }

        Value &copy(const Value &from, Value &reuse) override
        {
            if (!from)
            {
                reuse.reset();
            }
            else if (reuse)
            {
                original->copy(*from, *reuse);
            }
            else
            {
                reuse = original->copy(*from);
            }
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            auto isNull = source.read<bool>();
            target.write(isNull);
            if (isNull)
            {
                target.write(source, static_cast<size_t>(padding));
            }
            else
            {
                original->copy(source, target);
            }
        }

        int getLength() const override
        {
            return padding > 0 ? padding + 1 : TypeSerializer<Value>::VariableLength;
        }

        void serialize(const Value &value, OutputChannel &target) override
        {
            target.write(!value.has_value());
            if (!value)
            {
                target.skipBytesToWrite(static_cast<size_t>(padding));
            }
            else
            {
                original->serialize(*value, target);
            }
        }

        Value deserialize(InputChannel &source) override
        {
            if (source.read<bool>())
            {
                source.skipBytesToRead(static_cast<size_t>(padding));
                return std::nullopt;
            }
            return original->deserialize(source);
        }

        Value &deserialize(Value &reuse, InputChannel &source) override
        {
            if (source.read<bool>())
            {
                source.skipBytesToRead(static_cast<size_t>(padding));
                reuse.reset();
            }
            else if (reuse)
            {
                original->deserialize(*reuse, source);
            }
            else
            {
                reuse = original->deserialize(source);
            }
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<Value>> snapshotConfiguration() const override
        {
            return std::make_unique<NullableSerializerSnapshot<T>>(original->snapshotConfiguration(), padding);
        }

        bool equals(const TypeSerializer<Value> &other) const override
        {
            auto nullable = dynamic_cast<const NullableSerializer<T> *>(&other);
            return nullable != nullptr && padding == nullable->padding && *original == *nullable->original;
        }

    private:
        std::shared_ptr<TypeSerializer<T>> original;
        int padding;
    };

    /*!
     * Snapshot of NullableSerializer, nests the snapshot of the wrapped serializer
     * @tparam T Type of values serialized by the wrapped serializer
     */
    template<class T>
    class NullableSerializerSnapshot : public SerializerSnapshot<std::optional<T>>
    {
    public:
        typedef std::optional<T> Value;

        NullableSerializerSnapshot() = default;

        NullableSerializerSnapshot(std::unique_ptr<SerializerSnapshot<T>> nested, int padding) :
                nested(std::move(nested)), padding(padding)
        {}

        std::string snapshotTypeId() const override
        {
            return fmt::format("NullableSerializerSnapshot<{}>", typeid(T).name());
        }

        int getCurrentVersion() const override
        {
            return 1;
        }

        void writeSnapshot(OutputChannel &out) const override
        {
            if (!nested)
            {
                throw SerializationError("Nullable serializer snapshot has no nested snapshot");
            }
            out.write(static_cast<int32_t>(padding));
            writeSerializerSnapshot(out, *nested);
        }

        void readSnapshot(int, InputChannel &in, const SnapshotRegistry &registry) override
        {
            padding = in.read<int32_t>();
            nested = readSerializerSnapshot<T>(in, registry);
        }

        std::shared_ptr<TypeSerializer<Value>> restoreSerializer() const override
        {
            if (!nested)
            {
                throw SerializationError("Nullable serializer snapshot has no nested snapshot");
            }
            return std::make_shared<NullableSerializer<T>>(nested->restoreSerializer(), padding);
        }

        SchemaCompatibility<Value> resolveSchemaCompatibility(const TypeSerializer<Value> &newSerializer) const override
        {
            auto nullable = dynamic_cast<const NullableSerializer<T> *>(&newSerializer);
            if (!nested || nullable == nullptr || nullable->nullPaddingLength() != padding)
            {
                return SchemaCompatibility<Value>::incompatible();
            }
            auto inner = nested->resolveSchemaCompatibility(*nullable->originalSerializer());
            if (inner.isCompatibleWithReconfiguredSerializer())
            {
                return SchemaCompatibility<Value>::compatibleWithReconfiguredSerializer(
                        std::make_shared<NullableSerializer<T>>(inner.getReconfiguredSerializer(), padding));
            }
            return inner.isCompatibleAsIs() ? SchemaCompatibility<Value>::compatibleAsIs()
                                            : SchemaCompatibility<Value>::incompatible();
        }

    private:
        std::unique_ptr<SerializerSnapshot<T>> nested;
        int padding = 0;
    };

    /*!
     * Check that a serializer keeps its contract when wrapped into NullableSerializer
     *
     * Null must round trip and copy as null, a padded wrapper must write nulls with the same length as values,
     * and every test value must round trip through the wrapper.
     * @throws SerializationError describing the first broken expectation
     */
    template<class T>
    void checkIfNullSupported(TypeSerializer<T> &serializer, const std::vector<T> &testData,
                              const DeepEqualsChecker &checker)
    {
        auto nullable = NullableSerializer<T>::wrap(serializer.duplicate(), true);
        const int length = serializer.getLength() > 0 ? serializer.getLength() + 1
                                                      : TypeSerializer<std::optional<T>>::VariableLength;
        if (nullable->getLength() != length)
        {
            throw SerializationError(fmt::format("Wrapped serializer reports length {}, expected {}",
                                                 nullable->getLength(), length));
        }

        OutputChannel out;
        nullable->serialize(std::nullopt, out);
        if (length > 0 && out.size() != static_cast<size_t>(length))
        {
            throw SerializationError("The serialized form of the null value should have the same length as any "
                                     "other if the length is fixed in the serializer");
        }
        auto in = out.getInputView();
        if (nullable->deserialize(in).has_value() || in.available() != 0)
        {
            throw SerializationError("Serialized null value was not deserialized as null");
        }
        if (nullable->copy(std::optional<T>()).has_value())
        {
            throw SerializationError("Serializer has to be able to copy null value if it can serialize null value");
        }

        std::optional<T> reuse;
        for (const auto &value : testData)
        {
            out.clear();
            nullable->serialize(std::optional<T>(value), out);
            if (length > 0 && out.size() != static_cast<size_t>(length))
            {
                throw SerializationError(fmt::format("Wrapped value {} was written with {} bytes, expected {}",
                                                     describe(value), out.size(), length));
            }
            in = out.getInputView();
            auto restored = nullable->deserialize(in);
            if (!restored || !checker.equals(value, *restored) || in.available() != 0)
            {
                throw SerializationError(fmt::format("Wrapped value did not round trip. Expected: {} Actual: {}",
                                                     describe(value), describe(restored)));
            }
            auto &copied = nullable->copy(restored, reuse);
            if (!copied || !checker.equals(value, *copied))
            {
                throw SerializationError(fmt::format("Wrapped value was not copied. Expected: {} Actual: {}",
                                                     describe(value), describe(copied)));
            }
        }
    }
}

#endif //CONFORMANCE_NULLABLESERIALIZER_H
