// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_TYPESERIALIZER_H
#define CONFORMANCE_TYPESERIALIZER_H


#include "ByteChannel.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace Conformance
{
    class SnapshotRegistry;

    template<class T>
    class SerializerSnapshot;

    /*!
     * Contract of a serializer under test
     *
     * Implementations may keep mutable state (scratch buffers etc.), which is why most operations are non-const.
     * A serializer returned by duplicate() must not share such state with its source.
     * @tparam T Type of serialized values
     */
    template<class T>
    class TypeSerializer
    {
    public:
        typedef T ValueType;

        //! getLength() result of serializers producing values of varying size
        static constexpr int VariableLength = -1;

        virtual ~TypeSerializer() = default;

        //! Serializer safe to use concurrently with this one, stateless serializers may return themselves
        virtual std::shared_ptr<TypeSerializer<T>> duplicate() = 0;

        //! Default value used as a reuse target
        virtual T createInstance() const = 0;

        virtual T copy(const T &from) = 0;

        /*!
         * Copy value into a reuse target
         * @return Reference to the copied value, normally reuse itself
         */
        virtual T &copy(const T &from, T &reuse) = 0;

        //! Copy exactly one serialized value from source to target without decoding it into a T
        virtual void copy(InputChannel &source, OutputChannel &target) = 0;

        //! Size of every serialized value in bytes or VariableLength
        virtual int getLength() const = 0;

        virtual void serialize(const T &value, OutputChannel &target) = 0;

        virtual T deserialize(InputChannel &source) = 0;

        /*!
         * Deserialize value into a reuse target
         * @return Reference to the deserialized value, normally reuse itself
         */
        virtual T &deserialize(T &reuse, InputChannel &source) = 0;

        virtual std::unique_ptr<SerializerSnapshot<T>> snapshotConfiguration() const = 0;

        //! Serializers are equal if they are configured the same way
        virtual bool equals(const TypeSerializer<T> &other) const = 0;
    };

    template<class T>
    bool operator==(const TypeSerializer<T> &lhs, const TypeSerializer<T> &rhs)
    {
        return lhs.equals(rhs);
    }

    template<class T>
    bool operator!=(const TypeSerializer<T> &lhs, const TypeSerializer<T> &rhs)
    {
        return !lhs.equals(rhs);
    }

    /*!
     * Outcome of resolving a restored snapshot against the serializer currently in use
     * @tparam T Type of serialized values
     */
    template<class T>
    class SchemaCompatibility
    {
    public:
        enum Type
        {
            CompatibleAsIs,                         ///<Restored snapshot can recreate a serializer as is
            CompatibleWithReconfiguredSerializer,   ///<A different serializer has to be used from now on
            Incompatible                            ///<Data written with the snapshot can not be read
        };

        static SchemaCompatibility compatibleAsIs()
        {
            return SchemaCompatibility(CompatibleAsIs, nullptr);
        }

        static SchemaCompatibility compatibleWithReconfiguredSerializer(std::shared_ptr<TypeSerializer<T>> serializer)
        {
            return SchemaCompatibility(CompatibleWithReconfiguredSerializer, std::move(serializer));
        }

        static SchemaCompatibility incompatible()
        {
            return SchemaCompatibility(Incompatible, nullptr);
        }

        Type type() const noexcept
        {
            return resultType;
        }

        bool isCompatibleAsIs() const noexcept
        {
            return resultType == CompatibleAsIs;
        }

        bool isCompatibleWithReconfiguredSerializer() const noexcept
        {
            return resultType == CompatibleWithReconfiguredSerializer;
        }

        bool isIncompatible() const noexcept
        {
            return resultType == Incompatible;
        }

        //! @throws std::logic_error if the outcome is not CompatibleWithReconfiguredSerializer
        const std::shared_ptr<TypeSerializer<T>> &getReconfiguredSerializer() const
        {
            if (resultType != CompatibleWithReconfiguredSerializer)
            {
                throw std::logic_error("No reconfigured serializer for " + describe());
            }
            return reconfigured;
        }

        std::string describe() const
        {
            switch (resultType)
            {
                case CompatibleAsIs:
                    return "SchemaCompatibility{COMPATIBLE_AS_IS}";
                case CompatibleWithReconfiguredSerializer:
                    return "SchemaCompatibility{COMPATIBLE_WITH_RECONFIGURED_SERIALIZER}";
                case Incompatible:
                    return "SchemaCompatibility{INCOMPATIBLE}";
            }
            return "SchemaCompatibility{UNKNOWN}";
        }

    private:
        SchemaCompatibility(Type type, std::shared_ptr<TypeSerializer<T>> serializer) :
                resultType(type), reconfigured(std::move(serializer))
        {}

        Type resultType;
        std::shared_ptr<TypeSerializer<T>> reconfigured;
    };

    /*!
     * Type independent part of a configuration snapshot
     *
     * Written as type id, version and payload, see writeSerializerSnapshot().
     */
    class SnapshotBase
    {
    public:
        virtual ~SnapshotBase() = default;

        //! Stable name the snapshot type is registered under in a SnapshotRegistry
        virtual std::string snapshotTypeId() const = 0;

        virtual int getCurrentVersion() const = 0;

        virtual void writeSnapshot(OutputChannel &out) const = 0;

        /*!
         * Restore snapshot contents
         * @param readVersion Version the payload was written with
         * @param in Payload
         * @param registry Used to read nested snapshots
         */
        virtual void readSnapshot(int readVersion, InputChannel &in, const SnapshotRegistry &registry) = 0;
    };

    /*!
     * Point in time description of a serializer configuration
     * @tparam T Type of serialized values
     */
    template<class T>
    class SerializerSnapshot : public SnapshotBase
    {
    public:
        typedef T ValueType;

        virtual std::shared_ptr<TypeSerializer<T>> restoreSerializer() const = 0;

        virtual SchemaCompatibility<T> resolveSchemaCompatibility(const TypeSerializer<T> &newSerializer) const = 0;
    };

    /*!
     * Snapshot of a serializer without any configuration
     * @tparam T Type of serialized values
     * @tparam S Serializer type, must be default constructible
     */
    template<class T, class S>
    class SimpleSerializerSnapshot : public SerializerSnapshot<T>
    {
    public:
        explicit SimpleSerializerSnapshot(std::string typeId) : typeId(std::move(typeId))
        {}

        std::string snapshotTypeId() const override
        {
            return typeId;
        }

        int getCurrentVersion() const override
        {
            return 1;
        }

        void writeSnapshot(OutputChannel &) const override
        {}

        void readSnapshot(int, InputChannel &, const SnapshotRegistry &) override
        {}

        std::shared_ptr<TypeSerializer<T>> restoreSerializer() const override
        {
            return std::make_shared<S>();
        }

        SchemaCompatibility<T> resolveSchemaCompatibility(const TypeSerializer<T> &newSerializer) const override
        {
            return dynamic_cast<const S *>(&newSerializer) != nullptr ? SchemaCompatibility<T>::compatibleAsIs()
                                                                      : SchemaCompatibility<T>::incompatible();
        }

    private:
        std::string typeId;
    };
}

#endif //CONFORMANCE_TYPESERIALIZER_H
