// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#include <catch.hpp>

#include "SampleSerializers.h"
#include "SnapshotIO.h"

using namespace Conformance;
using namespace Samples;

namespace
{
    // Writes a payload it never reads back
    class UnreadPayloadSnapshot : public SimpleSerializerSnapshot<int32_t, IntSerializer>
    {
    public:
        UnreadPayloadSnapshot() : SimpleSerializerSnapshot("UnreadPayloadSnapshot")
        {}

        void writeSnapshot(OutputChannel &out) const override
        {
            out.write(int32_t(1));
        }
    };
}

TEST_CASE("Snapshot IO test")
{
    SnapshotRegistry registry;
    registry.registerSnapshot<IntSerializerSnapshot>()
            .registerSnapshot<BoundedStringSerializerSnapshot>()
            .registerSnapshot<StringSerializerSnapshot>();

    SECTION("Registry")
    {
        REQUIRE(registry.contains("Samples::IntSerializerSnapshot"));
        REQUIRE_FALSE(registry.contains("Samples::PointSerializerSnapshot"));
        REQUIRE(dynamic_cast<IntSerializerSnapshot *>(registry.instantiate("Samples::IntSerializerSnapshot").get()));
        REQUIRE_THROWS_AS(registry.instantiate("Samples::PointSerializerSnapshot"), DeserializationError);
        REQUIRE_THROWS_AS(registry.instantiateFor<std::string>("Samples::IntSerializerSnapshot"), DeserializationError);

        registry.registerFactory("NullFactory", []()
        { return std::unique_ptr<SnapshotBase>(); });
        REQUIRE_THROWS_AS(registry.instantiate("NullFactory"), DeserializationError);
    }
    SECTION("Write and read back")
    {
        OutputChannel out;
        writeSerializerSnapshot(out, BoundedStringSerializerSnapshot(16));
        auto in = out.getInputView();
        REQUIRE(in.read<std::string>() == "Samples::BoundedStringSerializerSnapshot");
        REQUIRE(in.read<int32_t>() == 2);
        REQUIRE(in.read<uint32_t>() == sizeof(uint32_t));

        in = out.getInputView();
        auto snapshot = readSerializerSnapshot<std::string>(in, registry);
        REQUIRE(in.available() == 0);
        auto restored = snapshot->restoreSerializer();
        REQUIRE(*restored == BoundedStringSerializer(16));
        REQUIRE(*restored != BoundedStringSerializer(17));
    }
    SECTION("Truncated snapshot")
    {
        OutputChannel out;
        writeSerializerSnapshot(out, BoundedStringSerializerSnapshot(16));
        auto data = out.data();
        data.pop_back();
        InputChannel in(data);
        REQUIRE_THROWS_AS(readSerializerSnapshot<std::string>(in, registry), DeserializationError);
    }
    SECTION("Unknown snapshot type")
    {
        OutputChannel out;
        writeSerializerSnapshot(out, PointSerializerSnapshot());
        auto in = out.getInputView();
        REQUIRE_THROWS_AS(readSerializerSnapshot<Point>(in, registry), DeserializationError);
    }
    SECTION("Unread payload")
    {
        registry.registerSnapshot<UnreadPayloadSnapshot>();
        OutputChannel out;
        writeSerializerSnapshot(out, UnreadPayloadSnapshot());
        auto in = out.getInputView();
        REQUIRE_THROWS_AS(readSerializerSnapshot<int32_t>(in, registry), DeserializationError);
    }
    SECTION("Clone")
    {
        BoundedStringSerializer serializer(8);
        auto clone = cloneSerializer<std::string>(serializer, registry);
        REQUIRE(clone);
        REQUIRE(clone.get() != &serializer);
        REQUIRE(*clone == serializer);

        PointSerializer unregistered;
        REQUIRE_THROWS_AS(cloneSerializer<Point>(unregistered, registry), DeserializationError);
    }
    SECTION("Schema compatibility")
    {
        BoundedStringSerializerSnapshot snapshot(8);

        auto larger = snapshot.resolveSchemaCompatibility(BoundedStringSerializer(10));
        REQUIRE(larger.isCompatibleWithReconfiguredSerializer());
        REQUIRE(*larger.getReconfiguredSerializer() == BoundedStringSerializer(8));

        auto smaller = snapshot.resolveSchemaCompatibility(BoundedStringSerializer(4));
        REQUIRE(smaller.isIncompatible());
        REQUIRE(smaller.describe() == "SchemaCompatibility{INCOMPATIBLE}");
        REQUIRE_THROWS_AS(smaller.getReconfiguredSerializer(), std::logic_error);

        REQUIRE(snapshot.resolveSchemaCompatibility(StringSerializer()).isIncompatible());

        StringSerializerSnapshot simple;
        REQUIRE(simple.resolveSchemaCompatibility(StringSerializer()).isCompatibleAsIs());
        REQUIRE(simple.resolveSchemaCompatibility(BoundedStringSerializer(4)).isIncompatible());
        REQUIRE(SchemaCompatibility<std::string>::compatibleAsIs().describe() == "SchemaCompatibility{COMPATIBLE_AS_IS}");
    }
}
