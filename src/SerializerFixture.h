// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_SERIALIZERFIXTURE_H
#define CONFORMANCE_SERIALIZERFIXTURE_H


#include "DeepEquals.h"
#include "SnapshotIO.h"
#include "TypeSerializer.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

namespace Conformance
{
    //! Run time settings of a conformance suite
    struct SuiteOptions
    {
        size_t workerCount = 10;                        ///<Concurrent workers of the duplication check
        std::chrono::milliseconds duration{120};        ///<Time each duplication worker keeps cycling
        size_t initialBufferCapacity = 128;             ///<Initial capacity of worker output channels
    };

    /*!
     * Everything the conformance suite needs to know about one serializer
     * @tparam T Type of serialized values
     */
    template<class T>
    class SerializerFixture
    {
    public:
        typedef T ValueType;

        virtual ~SerializerFixture() = default;

        //! Fresh serializer, called once per check
        virtual std::shared_ptr<TypeSerializer<T>> createSerializer() const = 0;

        /*!
         * Expected result of TypeSerializer::getLength()
         * @note Positive for fixed length values, TypeSerializer<T>::VariableLength otherwise, never zero
         */
        virtual int getLength() const = 0;

        //! Representative values, must not be empty
        virtual std::vector<T> getTestData() const = 0;

        /*!
         * Check the non null result of createInstance() against the declared type
         * @note Any value of static type T is assignable to it, including pointers to derived types
         */
        virtual bool isInstanceOfDeclaredType(const T &) const
        {
            return true;
        }

        //! Allow createInstance() to return an empty optional or null pointer
        virtual bool allowNullInstances() const
        {
            return false;
        }

        //! Register snapshot types the serializer produces, needed to restore snapshots from bytes
        virtual void registerSnapshots(SnapshotRegistry &registry) const = 0;

        //! Register comparators for types without usable operator==
        virtual void registerComparators(DeepEqualsChecker &) const
        {}
    };
}

#endif //CONFORMANCE_SERIALIZERFIXTURE_H
