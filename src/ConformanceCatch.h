// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_CONFORMANCECATCH_H
#define CONFORMANCE_CONFORMANCECATCH_H


#include "ConformanceSuite.h"

#include <catch.hpp>

/*!
 * Register the whole conformance suite of a fixture as a Catch2 test case
 *
 * Every property runs in its own section, so one failing property does not hide the others.
 * @param FixtureType Default constructible SerializerFixture implementation
 * @param tags Catch2 tags of the test case
 */
#define CONFORMANCE_TEST_CASE(FixtureType, tags)                                                        \
    TEST_CASE(#FixtureType " conforms to the serializer contract", tags)                                \
    {                                                                                                   \
        FixtureType conformanceFixture;                                                                 \
        ::Conformance::ConformanceSuite<FixtureType::ValueType> conformanceSuite(conformanceFixture);   \
        for (const auto &conformanceProperty : conformanceSuite.properties())                           \
        {                                                                                               \
            DYNAMIC_SECTION(conformanceProperty.name)                                                   \
            {                                                                                           \
                auto conformanceResult = ::Conformance::runProperty(conformanceProperty);               \
                INFO(conformanceResult.message);                                                        \
                REQUIRE(conformanceResult.passed);                                                      \
            }                                                                                           \
        }                                                                                               \
    }

#endif //CONFORMANCE_CONFORMANCECATCH_H
