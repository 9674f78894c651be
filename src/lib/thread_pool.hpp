/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of agora.

agora is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

agora is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

agora is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with agora. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace agora
{
    // Fixed set of workers for independent search branches. Exceptions thrown by a
    // task are kept and rethrown by wait(), so no branch failure goes unnoticed.
    class ThreadPool
    {
    public:
        explicit ThreadPool(size_t num_threads)
        {
            if (num_threads == 0) num_threads = 1;

            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this]
                                     {
                    while (true) {
                        std::function<void()> task;
                        {
                            std::unique_lock<std::mutex> lock(queue_mutex);
                            condition.wait(lock, [this] { return stop || !tasks.empty(); });
                            if (stop && tasks.empty()) return;
                            task = std::move(tasks.front());
                            tasks.pop();
                        }

                        try
                        {
                            task();
                        }
                        catch (...)
                        {
                            std::lock_guard<std::mutex> lock(queue_mutex);
                            if (!failure) failure = std::current_exception();
                        }

                        {
                            std::lock_guard<std::mutex> lock(queue_mutex);
                            --pending_tasks;
                        }
                        done.notify_all();
                    } });
            }
        }

        ~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop = true;
            }
            condition.notify_all();
            for (auto& worker : workers)
            {
                if (worker.joinable()) worker.join();
            }
        }

        ThreadPool(const ThreadPool&)            = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        void enqueue(std::function<void()> task)
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                tasks.emplace(std::move(task));
                ++pending_tasks;
            }
            condition.notify_one();
        }

        size_t count() const
        {
            return workers.size();
        }

        // blocks until every enqueued task finished, then rethrows the first task failure
        void wait()
        {
            std::exception_ptr error;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                done.wait(lock, [this]
                          { return pending_tasks == 0; });
                std::swap(error, failure);
            }

            if (error) std::rethrow_exception(error);
        }

    private:
        std::vector<std::thread>          workers;
        std::queue<std::function<void()>> tasks;
        std::mutex                        queue_mutex;
        std::condition_variable           condition;
        std::condition_variable           done;
        size_t                            pending_tasks{0};
        std::exception_ptr                failure;
        bool                              stop{false};
    };
}
