// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_SNAPSHOTIO_H
#define CONFORMANCE_SNAPSHOTIO_H


#include "ByteChannel.h"
#include "TypeSerializer.h"

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace Conformance
{
    /*!
     * Maps snapshot type ids to factories of empty snapshots
     *
     * Snapshots are restored from bytes by instantiating the registered type and letting it read its payload.
     */
    class SnapshotRegistry
    {
    public:
        typedef std::function<std::unique_ptr<SnapshotBase>()> Factory;

        /*!
         * Register a default constructible snapshot type under its own snapshotTypeId()
         * @tparam S Snapshot type
         */
        template<class S>
        SnapshotRegistry &registerSnapshot()
        {
            static_assert(std::is_base_of_v<SnapshotBase, S>, "Registered type must be a snapshot");
            static_assert(std::is_default_constructible_v<S>, "Registered snapshot must be default constructible");
            return registerFactory(S().snapshotTypeId(), []()
            {
                return std::unique_ptr<SnapshotBase>(std::make_unique<S>());
            });
        }

        SnapshotRegistry &registerFactory(const std::string &typeId, Factory factory)
        {
            factories[typeId] = std::move(factory);
            return *this;
        }

        bool contains(const std::string &typeId) const
        {
            return factories.count(typeId) > 0;
        }

        /*!
         * Create an empty snapshot of a registered type
         * @throws DeserializationError if the type id is unknown
         */
        std::unique_ptr<SnapshotBase> instantiate(const std::string &typeId) const
        {
            auto factory = factories.find(typeId);
            if (factory == factories.end())
            {
                throw DeserializationError(fmt::format("Unknown snapshot type \"{}\"", typeId));
            }
            auto snapshot = factory->second();
            if (!snapshot)
            {
                throw DeserializationError(fmt::format("Factory of snapshot type \"{}\" returned null", typeId));
            }
            return snapshot;
        }

        /*!
         * Create an empty snapshot of a registered type for serializers of T
         * @throws DeserializationError if the type id is unknown or describes serializers of another type
         */
        template<class T>
        std::unique_ptr<SerializerSnapshot<T>> instantiateFor(const std::string &typeId) const
        {
            auto snapshot = instantiate(typeId);
            auto typed = dynamic_cast<SerializerSnapshot<T> *>(snapshot.get());
            if (typed == nullptr)
            {
                throw DeserializationError(fmt::format("Snapshot type \"{}\" does not describe serializers of {}",
                                                       typeId, typeid(T).name()));
            }
            snapshot.release();
            return std::unique_ptr<SerializerSnapshot<T>>(typed);
        }

    private:
        std::map<std::string, Factory> factories;
    };

    /*!
     * Write snapshot as type id, version and length prefixed payload
     * @param out Channel to write to
     * @param snapshot Snapshot to write
     */
    inline void writeSerializerSnapshot(OutputChannel &out, const SnapshotBase &snapshot)
    {
        OutputChannel payload;
        snapshot.writeSnapshot(payload);
        out.write(snapshot.snapshotTypeId());
        out.write(static_cast<int32_t>(snapshot.getCurrentVersion()));
        out.write(static_cast<uint32_t>(payload.size()));
        out.writeRaw(payload.data().data(), payload.size());
    }

    /*!
     * Read snapshot written by writeSerializerSnapshot()
     * @tparam T Type of values serialized by the described serializer
     * @param in Channel to read from
     * @param registry Registry of known snapshot types
     * @throws DeserializationError on unknown type, truncated data or payload the snapshot did not fully consume
     */
    template<class T>
    std::unique_ptr<SerializerSnapshot<T>> readSerializerSnapshot(InputChannel &in, const SnapshotRegistry &registry)
    {
        auto typeId = in.read<std::string>();
        auto version = in.read<int32_t>();
        auto length = in.read<uint32_t>();
        if (in.available() < length)
        {
            throw DeserializationError("Provided serialized data size is too small");
        }
        std::vector<uint8_t> bytes(length);
        in.readRaw(bytes.data(), bytes.size());

        auto snapshot = registry.instantiateFor<T>(typeId);
        InputChannel payload(std::move(bytes));
        snapshot->readSnapshot(version, payload, registry);
        if (payload.available() != 0)
        {
            throw DeserializationError(fmt::format("Snapshot \"{}\" left {} bytes of its payload unread",
                                                   typeId, payload.available()));
        }
        return snapshot;
    }

    /*!
     * Clone a serializer by writing its configuration snapshot and restoring a serializer from the bytes
     * @throws SerializationError if the snapshot or restored serializer is null, DeserializationError if it can not
     * be read back
     */
    template<class T>
    std::shared_ptr<TypeSerializer<T>> cloneSerializer(const TypeSerializer<T> &serializer,
                                                       const SnapshotRegistry &registry)
    {
        auto snapshot = serializer.snapshotConfiguration();
        if (!snapshot)
        {
            throw SerializationError("Serializer returned null configuration snapshot");
        }
        OutputChannel out;
        writeSerializerSnapshot(out, *snapshot);
        auto in = out.getInputView();
        auto restored = readSerializerSnapshot<T>(in, registry)->restoreSerializer();
        if (!restored)
        {
            throw SerializationError(fmt::format("Snapshot \"{}\" restored null serializer",
                                                 snapshot->snapshotTypeId()));
        }
        return restored;
    }
}

#endif //CONFORMANCE_SNAPSHOTIO_H
