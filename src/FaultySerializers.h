// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_FAULTYSERIALIZERS_H
#define CONFORMANCE_FAULTYSERIALIZERS_H


#include "SampleSerializers.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

// Serializers breaking exactly one part of the contract each
namespace Faulty
{
    using namespace Conformance;
    using Samples::IntSerializer;
    using Samples::ScratchVectorSerializer;

    //! Snapshot restoring S, registered under the name of S
    template<class T, class S>
    class Snapshot : public SimpleSerializerSnapshot<T, S>
    {
    public:
        Snapshot() : SimpleSerializerSnapshot<T, S>(typeid(S).name())
        {}
    };

    //! Keeps the old contents of a non empty reuse target
    class StaleReuseSerializer : public ScratchVectorSerializer
    {
    public:
        Value &copy(const Value &from, Value &reuse) override
        {
            if (reuse.empty())
            {
                reuse = from;
            }
            return reuse;
        }

        using ScratchVectorSerializer::copy;

        std::unique_ptr<SerializerSnapshot<Value>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<Value, StaleReuseSerializer>>();
        }
    };

    //! Writes one byte more than it reads
    class TrailingBytesSerializer : public IntSerializer
    {
    public:
        void serialize(const int32_t &value, OutputChannel &target) override
        {
            IntSerializer::serialize(value, target);
            target.write(uint8_t(0xAB));
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, TrailingBytesSerializer>>();
        }
    };

    //! Reports a length it does not write
    class WrongLengthSerializer : public IntSerializer
    {
    public:
        int getLength() const override
        {
            return 8;
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, WrongLengthSerializer>>();
        }
    };

    //! Raw copy moves only part of a value
    class BrokenRawCopySerializer : public IntSerializer
    {
    public:
        void copy(InputChannel &source, OutputChannel &target) override
        {
            target.write(source, sizeof(int32_t) - 1);
        }

        using IntSerializer::copy;

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, BrokenRawCopySerializer>>();
        }
    };

    class RejectingSnapshot;

    //! Snapshot rejects every serializer, itself included
    class IncompatibleSnapshotSerializer : public IntSerializer
    {
    public:
        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override;
    };

    class RejectingSnapshot : public Snapshot<int32_t, IncompatibleSnapshotSerializer>
    {
    public:
        SchemaCompatibility<int32_t> resolveSchemaCompatibility(const TypeSerializer<int32_t> &) const override
        {
            return SchemaCompatibility<int32_t>::incompatible();
        }
    };

    inline std::unique_ptr<SerializerSnapshot<int32_t>> IncompatibleSnapshotSerializer::snapshotConfiguration() const
    {
        return std::make_unique<RejectingSnapshot>();
    }

    //! Equal to itself only
    class IdentitySerializer : public IntSerializer
    {
    public:
        bool equals(const TypeSerializer<int32_t> &other) const override
        {
            return &other == this;
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, IdentitySerializer>>();
        }
    };

    /*!
     * Passes every value through a scratch slot shared by all duplicates
     * @note The slot is atomic, concurrent duplicates overwrite each other's values without a data race
     */
    class SharedScratchSerializer : public IntSerializer
    {
    public:
        void serialize(const int32_t &value, OutputChannel &target) override
        {
            scratch.store(value);
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            target.write(scratch.load());
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, SharedScratchSerializer>>();
        }

    private:
        std::atomic<int32_t> scratch{0};
    };

    //! duplicate() returns nothing
    class NullDuplicateSerializer : public IntSerializer
    {
    public:
        std::shared_ptr<TypeSerializer<int32_t>> duplicate() override
        {
            return nullptr;
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, NullDuplicateSerializer>>();
        }
    };

    //! Only the first duplicate() succeeds
    class ThrowingDuplicateSerializer : public IntSerializer
    {
    public:
        std::shared_ptr<TypeSerializer<int32_t>> duplicate() override
        {
            if (duplicates++ > 0)
            {
                throw std::runtime_error("Serializer cannot be duplicated again");
            }
            return std::make_shared<ThrowingDuplicateSerializer>();
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, ThrowingDuplicateSerializer>>();
        }

    private:
        int duplicates = 0;
    };

    //! Writes nothing at all
    class SilentSerializer : public IntSerializer
    {
    public:
        void serialize(const int32_t &, OutputChannel &) override
        {}

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, SilentSerializer>>();
        }
    };

    //! Reads two values for each one, keeps the second
    class GreedyReadSerializer : public IntSerializer
    {
    public:
        int32_t deserialize(InputChannel &source) override
        {
            source.read<int32_t>();
            return source.read<int32_t>();
        }

        int32_t &deserialize(int32_t &reuse, InputChannel &source) override
        {
            reuse = deserialize(source);
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, GreedyReadSerializer>>();
        }
    };

    //! Writes every value twice
    class DoubleWriteSerializer : public IntSerializer
    {
    public:
        void serialize(const int32_t &value, OutputChannel &target) override
        {
            target.write(value);
            target.write(value);
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override
        {
            return std::make_unique<Snapshot<int32_t, DoubleWriteSerializer>>();
        }
    };
}

#endif //CONFORMANCE_FAULTYSERIALIZERS_H
