// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_CONFORMANCEERRORS_H
#define CONFORMANCE_CONFORMANCEERRORS_H


#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace Conformance
{
    /*!
     * Base of every failure raised by the conformance suite
     * @note Message is prefixed with the name of the property that failed
     */
    class ConformanceError : public std::runtime_error
    {
    public:
        ConformanceError(std::string property, const std::string &msg) :
                std::runtime_error(fmt::format("[{}] {}", property, msg)), propertyName(std::move(property))
        {}

        const std::string &property() const noexcept
        {
            return propertyName;
        }

    private:
        std::string propertyName;
    };

    //! Fixture supplied unusable input: no serializer, no test data, zero length
    class FixtureError : public ConformanceError
    {
    public:
        using ConformanceError::ConformanceError;
    };

    //! Serializer under test broke its contract
    class ContractViolation : public ConformanceError
    {
    public:
        using ConformanceError::ConformanceError;
    };

    //! Serializer could not be cloned through its configuration snapshot
    class CloneError : public ConformanceError
    {
    public:
        using ConformanceError::ConformanceError;
    };

    //! Failure captured inside one of the duplication workers
    class ConcurrentFailure : public ConformanceError
    {
    public:
        ConcurrentFailure(std::string property, size_t worker, const std::string &msg) :
                ConformanceError(std::move(property), msg), worker(worker)
        {}

        size_t workerIndex() const noexcept
        {
            return worker;
        }

    private:
        size_t worker;
    };

    /*!
     * Flatten exception and its nested causes into a single line
     * @return Messages of the whole chain joined with ": "
     */
    inline std::string describeException(const std::exception &e)
    {
        std::string text = e.what();
        try
        {
            std::rethrow_if_nested(e);
        }
        catch (const std::exception &nested)
        {
            text += ": " + describeException(nested);
        }
        catch (...)
        {
            text += ": unknown exception";
        }
        return text;
    }

    inline std::string describeException(const std::exception_ptr &error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &e)
        {
            return describeException(e);
        }
        catch (...)
        {
            return "unknown exception";
        }
    }
}

#endif //CONFORMANCE_CONFORMANCEERRORS_H
