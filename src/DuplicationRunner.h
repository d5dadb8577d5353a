// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_DUPLICATIONRUNNER_H
#define CONFORMANCE_DUPLICATIONRUNNER_H


#include "ByteChannel.h"
#include "ConformanceErrors.h"
#include "DeepEquals.h"
#include "SerializerFixture.h"
#include "TypeSerializer.h"

#include <fmt/format.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace Conformance
{
    /*!
     * One shot barrier releasing all parties at once
     *
     * Breaking the barrier releases every waiting and future party with a negative result.
     */
    class StartBarrier
    {
    public:
        explicit StartBarrier(size_t parties) : parties(parties)
        {}

        StartBarrier(const StartBarrier &) = delete;
        StartBarrier &operator=(const StartBarrier &) = delete;

        /*!
         * Wait until all parties arrived
         * @return true if all parties arrived, false if the barrier was broken
         */
        bool await()
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (++arrived >= parties)
            {
                condition.notify_all();
            }
            else
            {
                condition.wait(lock, [this]
                { return broken || arrived >= parties; });
            }
            return !broken;
        }

        void breakBarrier()
        {
            std::lock_guard<std::mutex> lock(mutex);
            broken = true;
            condition.notify_all();
        }

    private:
        std::mutex mutex;
        std::condition_variable condition;
        const size_t parties;
        size_t arrived = 0;
        bool broken = false;
    };

    /*!
     * Drives duplicates of a serializer from concurrent workers to reveal state shared between duplicates
     *
     * Every worker owns a duplicate and a pair of channels. Workers start together and cycle
     * serialize, deserialize, copy and compare over the test data until their time is up.
     * @tparam T Type of serialized values
     */
    template<class T>
    class DuplicationRunner
    {
    public:
        static constexpr const char *Property = "duplicate";

        DuplicationRunner(std::shared_ptr<TypeSerializer<T>> serializer, const std::vector<T> &testData,
                          const DeepEqualsChecker &checker, SuiteOptions options) :
                serializer(std::move(serializer)), testData(testData), checker(checker), options(options)
        {
            if (!this->serializer)
            {
                throw FixtureError(Property, "Test case corrupt. Returns null as serializer.");
            }
            if (testData.empty())
            {
                throw FixtureError(Property, "Test case corrupt. Returns no test data.");
            }
            if (options.workerCount == 0 || options.duration.count() <= 0)
            {
                throw FixtureError(Property, "Duplication check needs at least one worker and a positive duration");
            }
        }

        /*!
         * Run all workers to completion
         * @throws ConcurrentFailure with the failure of the lowest indexed failed worker nested
         * @throws ContractViolation if duplicate() returns null
         */
        void run()
        {
            std::vector<Worker> workers(options.workerCount);
            for (size_t i = 0; i < workers.size(); ++i)
            {
                workers[i].index = i;
                workers[i].serializer = serializer->duplicate();
                if (!workers[i].serializer)
                {
                    throw ContractViolation(Property, "duplicate() returned null");
                }
                workers[i].output = OutputChannel(options.initialBufferCapacity);
            }

            StartBarrier barrier(workers.size());
            std::vector<std::thread> threads;
            threads.reserve(workers.size());
            try
            {
                for (auto &worker : workers)
                {
                    threads.emplace_back(&DuplicationRunner::runWorker, this, std::ref(worker), std::ref(barrier));
                }
            }
            catch (...)
            {
                barrier.breakBarrier();
                for (auto &thread : threads)
                {
                    thread.join();
                }
                throw;
            }
            for (auto &thread : threads)
            {
                thread.join();
            }

            const Worker *firstFailed = nullptr;
            for (const auto &worker : workers)
            {
                if (worker.failure)
                {
                    fmt::print(stderr, "Duplication worker {} of {} failed: {}\n", worker.index, workers.size(),
                               describeException(worker.failure));
                    if (firstFailed == nullptr)
                    {
                        firstFailed = &worker;
                    }
                }
            }
            if (firstFailed != nullptr)
            {
                try
                {
                    std::rethrow_exception(firstFailed->failure);
                }
                catch (...)
                {
                    std::throw_with_nested(ConcurrentFailure(
                            Property, firstFailed->index,
                            fmt::format("Worker {} of {} failed: {}", firstFailed->index, workers.size(),
                                        describeException(firstFailed->failure))));
                }
            }
        }

    private:
        struct Worker
        {
            size_t index = 0;
            std::shared_ptr<TypeSerializer<T>> serializer;
            OutputChannel output;
            InputChannel input;
            std::exception_ptr failure;
        };

        // Each worker writes its own slot only, results are read after join
        void runWorker(Worker &worker, StartBarrier &barrier)
        {
            try
            {
                if (!barrier.await())
                {
                    return;
                }
                const auto deadline = std::chrono::steady_clock::now() + options.duration;
                // start at different values so lock stepped workers still disagree
                const size_t offset = worker.index % testData.size();
                do
                {
                    for (size_t i = 0; i < testData.size(); ++i)
                    {
                        const T &item = testData[(offset + i) % testData.size()];
                        worker.serializer->serialize(item, worker.output);
                        worker.input.setBuffer(worker.output.data());
                        T deserialized = worker.serializer->deserialize(worker.input);
                        T copy = worker.serializer->copy(deserialized);
                        worker.output.clear();

                        if (!checker.equals(item, copy))
                        {
                            throw ContractViolation(Property, fmt::format(
                                    "Serialization/Deserialization cycle resulted in an object that is not equal "
                                    "to the original. Expected: {} Actual: {}", describe(item), describe(copy)));
                        }
                    }
                }
                while (std::chrono::steady_clock::now() < deadline);
            }
            catch (...)
            {
                worker.failure = std::current_exception();
            }
        }

        std::shared_ptr<TypeSerializer<T>> serializer;
        const std::vector<T> &testData;
        const DeepEqualsChecker &checker;
        SuiteOptions options;
    };
}

#endif //CONFORMANCE_DUPLICATIONRUNNER_H
