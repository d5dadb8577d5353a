// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#include <catch.hpp>

#include "DeepEquals.h"
#include "SampleSerializers.h"

#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>

using namespace Conformance;
using Samples::Point;

namespace
{
    struct Shape
    {
        virtual ~Shape() = default;
    };

    struct Circle : Shape
    {
        explicit Circle(double radius) : radius(radius) {}
        double radius;
    };

    struct Square : Shape
    {
        explicit Square(double side) : side(side) {}
        double side;
    };

    struct Opaque
    {
        int v;
    };

    //! Equal only to itself through operator==
    struct Tag
    {
        int value;

        bool operator==(const Tag &other) const
        {
            return this == &other;
        }
    };

    struct TagHash
    {
        size_t operator()(const Tag &tag) const
        {
            return std::hash<int>()(tag.value);
        }
    };

    bool samePoint(const Point &lhs, const Point &rhs)
    {
        return lhs.x == rhs.x && lhs.y == rhs.y;
    }
}

TEST_CASE("Deep equality test")
{
    DeepEqualsChecker checker;

    SECTION("Leaves")
    {
        REQUIRE(checker.equals(1, 1));
        REQUIRE_FALSE(checker.equals(1, 2));
        REQUIRE(checker.equals(std::string("abc"), std::string("abc")));
        REQUIRE_FALSE(checker.equals(std::string("abc"), std::string("abd")));
    }
    SECTION("Floating point")
    {
        REQUIRE(checker.equals(NAN, NAN));
        REQUIRE(checker.equals(std::nan(""), std::nan("")));
        REQUIRE(checker.equals(0.0, -0.0));
        REQUIRE_FALSE(checker.equals(1.0, std::nan("")));
    }
    SECTION("Optional")
    {
        REQUIRE(checker.equals(std::optional<int>(), std::optional<int>()));
        REQUIRE(checker.equals(std::optional<int>(3), std::optional<int>(3)));
        REQUIRE_FALSE(checker.equals(std::optional<int>(3), std::optional<int>()));
        REQUIRE_FALSE(checker.equals(std::optional<int>(), std::optional<int>(3)));
    }
    SECTION("Pointers")
    {
        std::shared_ptr<int> null;
        REQUIRE(checker.equals(null, std::shared_ptr<int>()));
        REQUIRE_FALSE(checker.equals(null, std::make_shared<int>(1)));
        REQUIRE(checker.equals(std::make_shared<int>(1), std::make_shared<int>(1)));
        REQUIRE_FALSE(checker.equals(std::make_shared<int>(1), std::make_shared<int>(2)));

        int a = 5, b = 5;
        const int *pa = &a, *pb = &b;
        REQUIRE(checker.equals(pa, pb));
    }
    SECTION("Containers")
    {
        REQUIRE(checker.equals(std::vector<int>{1, 2, 3}, std::vector<int>{1, 2, 3}));
        REQUIRE_FALSE(checker.equals(std::vector<int>{1, 2, 3}, std::vector<int>{1, 2}));
        REQUIRE_FALSE(checker.equals(std::vector<int>{1, 2}, std::vector<int>{1, 2, 3}));
        REQUIRE_FALSE(checker.equals(std::vector<int>{1, 2, 3}, std::vector<int>{3, 2, 1}));
        REQUIRE(checker.equals(std::vector<double>{NAN, 1.0}, std::vector<double>{NAN, 1.0}));
        REQUIRE(checker.equals(std::unordered_set<int>{1, 2, 3}, std::unordered_set<int>{3, 2, 1}));

        std::map<int, std::string> m1 {{1, "a"}, {2, "b"}};
        std::map<int, std::string> m2 {{1, "a"}, {2, "c"}};
        REQUIRE(checker.equals(m1, m1));
        REQUIRE_FALSE(checker.equals(m1, m2));
    }
    SECTION("Tuples")
    {
        REQUIRE(checker.equals(std::make_tuple(1, std::string("x"), NAN), std::make_tuple(1, std::string("x"), NAN)));
        REQUIRE_FALSE(checker.equals(std::make_pair(1, 2), std::make_pair(1, 3)));
    }
    SECTION("Registered comparator")
    {
        SECTION("Missing")
        {
            REQUIRE_FALSE(checker.hasComparator<Point>());
            REQUIRE_THROWS_AS(checker.equals(Point{1, 2}, Point{1, 2}), FixtureError);
            REQUIRE_THROWS_AS(checker.equals(std::vector<Opaque>{{1}}, std::vector<Opaque>{{1}}), FixtureError);
        }
        SECTION("Used for nested values")
        {
            checker.registerComparator<Point>(samePoint);
            REQUIRE(checker.hasComparator<Point>());
            REQUIRE(checker.equals(Point{1, 2}, Point{1, 2}));
            REQUIRE_FALSE(checker.equals(Point{1, 2}, Point{2, 1}));

            std::vector<std::optional<Point>> v1 {Point{1, 2}, std::nullopt};
            std::vector<std::optional<Point>> v2 {Point{1, 2}, std::nullopt};
            REQUIRE(checker.equals(v1, v2));
            v2[1] = Point{0, 0};
            REQUIRE_FALSE(checker.equals(v1, v2));
        }
        SECTION("Used for elements of hashed containers")
        {
            typedef std::unordered_set<Tag, TagHash> TagSet;
            REQUIRE_FALSE(checker.equals(TagSet{{1}, {2}}, TagSet{{2}, {1}}));

            checker.registerComparator<Tag>([](const Tag &lhs, const Tag &rhs)
                                            { return lhs.value == rhs.value; });
            REQUIRE(checker.equals(std::vector<Tag>{{1}, {2}}, std::vector<Tag>{{1}, {2}}));
            REQUIRE(checker.equals(TagSet{{1}, {2}}, TagSet{{2}, {1}}));
            REQUIRE_FALSE(checker.equals(TagSet{{1}, {2}}, TagSet{{1}, {3}}));
            REQUIRE_FALSE(checker.equals(TagSet{{1}, {2}}, TagSet{{1}}));

            checker.registerComparator<Point>(samePoint);
            std::unordered_map<int, Point> m1 {{1, {1, 2}}, {2, {3, 4}}};
            std::unordered_map<int, Point> m2 {{2, {3, 4}}, {1, {1, 2}}};
            REQUIRE(checker.equals(m1, m2));
            m2[2] = Point{4, 3};
            REQUIRE_FALSE(checker.equals(m1, m2));
        }
        SECTION("Takes precedence over operator==")
        {
            checker.registerComparator<int>([](const int &lhs, const int &rhs)
                                            { return lhs % 10 == rhs % 10; });
            REQUIRE(checker.equals(3, 13));
            REQUIRE(checker.equals(std::vector<int>{1, 2}, std::vector<int>{11, 22}));
        }
        SECTION("Looked up by dynamic type of pointees")
        {
            checker.registerComparator<Circle>([](const Circle &lhs, const Circle &rhs)
                                               { return lhs.radius == rhs.radius; });
            std::shared_ptr<Shape> c1 = std::make_shared<Circle>(1.0);
            std::shared_ptr<Shape> c2 = std::make_shared<Circle>(1.0);
            std::shared_ptr<Shape> c3 = std::make_shared<Circle>(2.0);
            std::shared_ptr<Shape> s1 = std::make_shared<Square>(1.0);
            REQUIRE(checker.equals(c1, c2));
            REQUIRE_FALSE(checker.equals(c1, c3));
            REQUIRE_FALSE(checker.equals(c1, s1));
        }
    }
    SECTION("Describe")
    {
        REQUIRE(describe(42) == "42");
        REQUIRE(describe(std::string("abc")) == "\"abc\"");
        REQUIRE(describe(std::optional<int>()) == "null");
        REQUIRE(describe(std::optional<int>(7)) == "7");
        REQUIRE(describe(std::shared_ptr<int>()) == "null");
        REQUIRE(describe(Point{1, 2}) == "Point(1, 2)");
        REQUIRE(describe(std::vector<int64_t>{1, -2}) == "[1, -2]");
        REQUIRE(describe(std::make_pair(1, std::string("a"))) == "(1, \"a\")");
        REQUIRE(describe(Opaque{1}).front() == '<');
    }
}
