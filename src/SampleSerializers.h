// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_SAMPLESERIALIZERS_H
#define CONFORMANCE_SAMPLESERIALIZERS_H


#include "ByteChannel.h"
#include "SnapshotIO.h"
#include "TypeSerializer.h"

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <typeinfo>
#include <vector>

// Correct serializers the harness itself is tested against
namespace Samples
{
    using namespace Conformance;

    /*!
     * Stateless serializer of 32 bit integers
     * @note duplicate() returns the serializer itself
     */
    class IntSerializer : public TypeSerializer<int32_t>, public std::enable_shared_from_this<IntSerializer>
    {
    public:
        std::shared_ptr<TypeSerializer<int32_t>> duplicate() override
        {
            return shared_from_this();
        }

        int32_t createInstance() const override
        {
            return 0;
        }

        int32_t copy(const int32_t &from) override
        {
            return from;
        }

        int32_t &copy(const int32_t &from, int32_t &reuse) override
        {
            reuse = from;
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            target.write(source, sizeof(int32_t));
        }

        int getLength() const override
        {
            return sizeof(int32_t);
        }

        void serialize(const int32_t &value, OutputChannel &target) override
        {
            target.write(value);
        }

        int32_t deserialize(InputChannel &source) override
        {
            return source.read<int32_t>();
        }

        int32_t &deserialize(int32_t &reuse, InputChannel &source) override
        {
            source.read(reuse);
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<int32_t>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<int32_t> &other) const override
        {
            return typeid(other) == typeid(*this);
        }
    };

    class IntSerializerSnapshot : public SimpleSerializerSnapshot<int32_t, IntSerializer>
    {
    public:
        IntSerializerSnapshot() : SimpleSerializerSnapshot("Samples::IntSerializerSnapshot")
        {}
    };

    inline std::unique_ptr<SerializerSnapshot<int32_t>> IntSerializer::snapshotConfiguration() const
    {
        return std::make_unique<IntSerializerSnapshot>();
    }

    //! Length prefixed strings
    class StringSerializer : public TypeSerializer<std::string>
    {
    public:
        std::shared_ptr<TypeSerializer<std::string>> duplicate() override
        {
            return std::make_shared<StringSerializer>();
        }

        std::string createInstance() const override
        {
            return std::string();
        }

        std::string copy(const std::string &from) override
        {
            return from;
        }

        std::string &copy(const std::string &from, std::string &reuse) override
        {
            reuse = from;
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            auto length = source.read<uint32_t>();
            target.write(length);
            target.write(source, length);
        }

        int getLength() const override
        {
            return VariableLength;
        }

        void serialize(const std::string &value, OutputChannel &target) override
        {
            target.write(value);
        }

        std::string deserialize(InputChannel &source) override
        {
            return source.read<std::string>();
        }

        std::string &deserialize(std::string &reuse, InputChannel &source) override
        {
            source.read(reuse);
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<std::string>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<std::string> &other) const override
        {
            return typeid(other) == typeid(*this);
        }
    };

    class StringSerializerSnapshot : public SimpleSerializerSnapshot<std::string, StringSerializer>
    {
    public:
        StringSerializerSnapshot() : SimpleSerializerSnapshot("Samples::StringSerializerSnapshot")
        {}
    };

    inline std::unique_ptr<SerializerSnapshot<std::string>> StringSerializer::snapshotConfiguration() const
    {
        return std::make_unique<StringSerializerSnapshot>();
    }

    /*!
     * Vectors of 64 bit integers encoded through a private scratch channel
     * @note Not thread safe, duplicate() creates a serializer with its own scratch channel
     */
    class ScratchVectorSerializer : public TypeSerializer<std::vector<int64_t>>
    {
    public:
        typedef std::vector<int64_t> Value;

        std::shared_ptr<TypeSerializer<Value>> duplicate() override
        {
            return std::make_shared<ScratchVectorSerializer>();
        }

        Value createInstance() const override
        {
            return Value();
        }

        Value copy(const Value &from) override
        {
            return from;
        }

        Value &copy(const Value &from, Value &reuse) override
        {
            reuse.assign(from.begin(), from.end());
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            auto length = source.read<uint32_t>();
            target.write(length);
            target.write(source, size_t(length) * sizeof(int64_t));
        }

        int getLength() const override
        {
            return VariableLength;
        }

        void serialize(const Value &value, OutputChannel &target) override
        {
            scratch.clear();
            scratch.write(value);
            target.writeRaw(scratch.data().data(), scratch.size());
        }

        Value deserialize(InputChannel &source) override
        {
            return source.read<Value>();
        }

        Value &deserialize(Value &reuse, InputChannel &source) override
        {
            source.read(reuse);
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<Value>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<Value> &other) const override
        {
            return typeid(other) == typeid(*this);
        }

    private:
        OutputChannel scratch;
    };

    class ScratchVectorSerializerSnapshot : public SimpleSerializerSnapshot<std::vector<int64_t>, ScratchVectorSerializer>
    {
    public:
        ScratchVectorSerializerSnapshot() : SimpleSerializerSnapshot("Samples::ScratchVectorSerializerSnapshot")
        {}
    };

    inline std::unique_ptr<SerializerSnapshot<std::vector<int64_t>>>
    ScratchVectorSerializer::snapshotConfiguration() const
    {
        return std::make_unique<ScratchVectorSerializerSnapshot>();
    }

    //! Value without operator==, needs a registered comparator
    struct Point
    {
        double x = 0;
        double y = 0;
    };

    inline std::ostream &operator<<(std::ostream &out, const Point &point)
    {
        return out << "Point(" << point.x << ", " << point.y << ")";
    }

    class PointSerializer : public TypeSerializer<Point>
    {
    public:
        std::shared_ptr<TypeSerializer<Point>> duplicate() override
        {
            return std::make_shared<PointSerializer>();
        }

        Point createInstance() const override
        {
            return Point();
        }

        Point copy(const Point &from) override
        {
            return from;
        }

        Point &copy(const Point &from, Point &reuse) override
        {
            reuse = from;
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            target.write(source, 2 * sizeof(double));
        }

        int getLength() const override
        {
            return 2 * sizeof(double);
        }

        void serialize(const Point &value, OutputChannel &target) override
        {
            target.write(value.x);
            target.write(value.y);
        }

        Point deserialize(InputChannel &source) override
        {
            Point point;
            return deserialize(point, source);
        }

        Point &deserialize(Point &reuse, InputChannel &source) override
        {
            // both coordinates or nothing
            auto coordinates = source.read<std::pair<double, double>>();
            reuse.x = coordinates.first;
            reuse.y = coordinates.second;
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<Point>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<Point> &other) const override
        {
            return typeid(other) == typeid(*this);
        }
    };

    class PointSerializerSnapshot : public SimpleSerializerSnapshot<Point, PointSerializer>
    {
    public:
        PointSerializerSnapshot() : SimpleSerializerSnapshot("Samples::PointSerializerSnapshot")
        {}
    };

    inline std::unique_ptr<SerializerSnapshot<Point>> PointSerializer::snapshotConfiguration() const
    {
        return std::make_unique<PointSerializerSnapshot>();
    }

    //! Polymorphic base, serialized through pointers
    struct Shape
    {
        virtual ~Shape() = default;

        virtual void print(std::ostream &out) const = 0;
    };

    inline std::ostream &operator<<(std::ostream &out, const Shape &shape)
    {
        shape.print(out);
        return out;
    }

    struct Circle : public Shape
    {
        Circle() = default;

        explicit Circle(double radius) : radius(radius)
        {}

        void print(std::ostream &out) const override
        {
            out << "Circle(" << radius << ")";
        }

        double radius = 0;
    };

    //! Shapes declared by their base type, every instance is a Circle
    class CircleSerializer : public TypeSerializer<std::shared_ptr<Shape>>
    {
    public:
        typedef std::shared_ptr<Shape> Value;

        std::shared_ptr<TypeSerializer<Value>> duplicate() override
        {
            return std::make_shared<CircleSerializer>();
        }

        Value createInstance() const override
        {
            return std::make_shared<Circle>();
        }

        Value copy(const Value &from) override
        {
            return std::make_shared<Circle>(circle(from));
        }

        Value &copy(const Value &from, Value &reuse) override
        {
            auto target = std::dynamic_pointer_cast<Circle>(reuse);
            if (target)
            {
                target->radius = circle(from).radius;
            }
            else
            {
                reuse = copy(from);
            }
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            target.write(source, sizeof(double));
        }

        int getLength() const override
        {
            return sizeof(double);
        }

        void serialize(const Value &value, OutputChannel &target) override
        {
            target.write(circle(value).radius);
        }

        Value deserialize(InputChannel &source) override
        {
            return std::make_shared<Circle>(source.read<double>());
        }

        Value &deserialize(Value &reuse, InputChannel &source) override
        {
            auto radius = source.read<double>();
            auto target = std::dynamic_pointer_cast<Circle>(reuse);
            if (target)
            {
                target->radius = radius;
            }
            else
            {
                reuse = std::make_shared<Circle>(radius);
            }
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<Value>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<Value> &other) const override
        {
            return typeid(other) == typeid(*this);
        }

    private:
        static const Circle &circle(const Value &value)
        {
            auto result = dynamic_cast<const Circle *>(value.get());
            if (result == nullptr)
            {
                throw SerializationError("Only non null circles are supported");
            }
            return *result;
        }
    };

    class CircleSerializerSnapshot : public SimpleSerializerSnapshot<std::shared_ptr<Shape>, CircleSerializer>
    {
    public:
        CircleSerializerSnapshot() : SimpleSerializerSnapshot("Samples::CircleSerializerSnapshot")
        {}
    };

    inline std::unique_ptr<SerializerSnapshot<std::shared_ptr<Shape>>> CircleSerializer::snapshotConfiguration() const
    {
        return std::make_unique<CircleSerializerSnapshot>();
    }

    /*!
     * Strings limited to a configured length
     *
     * Data written with a limit can be read by any serializer with the same or a larger limit,
     * the restored limit is kept for such data.
     */
    class BoundedStringSerializer : public TypeSerializer<std::string>
    {
    public:
        explicit BoundedStringSerializer(uint32_t maxLength) : maxLength(maxLength)
        {}

        uint32_t getMaxLength() const noexcept
        {
            return maxLength;
        }

        std::shared_ptr<TypeSerializer<std::string>> duplicate() override
        {
            return std::make_shared<BoundedStringSerializer>(maxLength);
        }

        std::string createInstance() const override
        {
            return std::string();
        }

        std::string copy(const std::string &from) override
        {
            return from;
        }

        std::string &copy(const std::string &from, std::string &reuse) override
        {
            reuse = from;
            return reuse;
        }

        void copy(InputChannel &source, OutputChannel &target) override
        {
            auto length = source.read<uint32_t>();
            checkLength(length);
            target.write(length);
            target.write(source, length);
        }

        int getLength() const override
        {
            return VariableLength;
        }

        void serialize(const std::string &value, OutputChannel &target) override
        {
            checkLength(value.size());
            target.write(value);
        }

        std::string deserialize(InputChannel &source) override
        {
            std::string value;
            return deserialize(value, source);
        }

        std::string &deserialize(std::string &reuse, InputChannel &source) override
        {
            source.read(reuse);
            checkLength(reuse.size());
            return reuse;
        }

        std::unique_ptr<SerializerSnapshot<std::string>> snapshotConfiguration() const override;

        bool equals(const TypeSerializer<std::string> &other) const override
        {
            auto bounded = dynamic_cast<const BoundedStringSerializer *>(&other);
            return bounded != nullptr && typeid(other) == typeid(*this) && bounded->maxLength == maxLength;
        }

    private:
        void checkLength(size_t length) const
        {
            if (length > maxLength)
            {
                throw SerializationError(fmt::format("String of length {} exceeds the limit of {}", length,
                                                     maxLength));
            }
        }

        uint32_t maxLength;
    };

    class BoundedStringSerializerSnapshot : public SerializerSnapshot<std::string>
    {
    public:
        BoundedStringSerializerSnapshot() = default;

        explicit BoundedStringSerializerSnapshot(uint32_t maxLength) : maxLength(maxLength)
        {}

        std::string snapshotTypeId() const override
        {
            return "Samples::BoundedStringSerializerSnapshot";
        }

        int getCurrentVersion() const override
        {
            return 2;
        }

        void writeSnapshot(OutputChannel &out) const override
        {
            out.write(maxLength);
        }

        void readSnapshot(int readVersion, InputChannel &in, const SnapshotRegistry &) override
        {
            if (readVersion < 2)
            {
                throw DeserializationError(fmt::format("Unsupported snapshot version {}", readVersion));
            }
            in.read(maxLength);
        }

        std::shared_ptr<TypeSerializer<std::string>> restoreSerializer() const override
        {
            return std::make_shared<BoundedStringSerializer>(maxLength);
        }

        SchemaCompatibility<std::string> resolveSchemaCompatibility(
                const TypeSerializer<std::string> &newSerializer) const override
        {
            auto bounded = dynamic_cast<const BoundedStringSerializer *>(&newSerializer);
            if (bounded == nullptr || bounded->getMaxLength() < maxLength)
            {
                return SchemaCompatibility<std::string>::incompatible();
            }
            return SchemaCompatibility<std::string>::compatibleWithReconfiguredSerializer(restoreSerializer());
        }

    private:
        uint32_t maxLength = 0;
    };

    inline std::unique_ptr<SerializerSnapshot<std::string>> BoundedStringSerializer::snapshotConfiguration() const
    {
        return std::make_unique<BoundedStringSerializerSnapshot>(maxLength);
    }
}

#endif //CONFORMANCE_SAMPLESERIALIZERS_H
