#ifndef RETRIEVE_WORKER_POOL_HPP_INCLUDED
#define RETRIEVE_WORKER_POOL_HPP_INCLUDED
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace retrieve {
    // Fixed set of threads, each owning one T. Tasks are argument packs
    // applied to whichever worker picks them up, so per-worker state such as
    // a connection pool is never shared between threads.
    template<typename T>
    class worker_pool {
        std::vector<T> workers;
        std::vector<std::thread> threads;

        // Tasks
        std::deque<std::packaged_task<void(T&)>> tasks;
        std::condition_variable task_available;
        std::mutex task_mutex;
        bool stopping = false;

        // Finished event
        std::size_t tasks_left = 0;
        std::condition_variable finished;

        void run(std::size_t i) {
            while(true) {
                std::packaged_task<void(T&)> current_task;
                {
                    std::unique_lock<std::mutex> lock(task_mutex);
                    task_available.wait(lock, [&](){ return stopping || !tasks.empty(); });
                    if(tasks.empty()) return;
                    current_task = std::move(tasks.front());
                    tasks.pop_front();
                }
                current_task(workers[i]);
                {
                    std::lock_guard<std::mutex> lock(task_mutex);
                    if(--tasks_left == 0) finished.notify_all();
                }
            }
        }

        public:
        explicit worker_pool(std::size_t n_threads) : workers(n_threads) {
            threads.reserve(n_threads);
            for(std::size_t i = 0; i < n_threads; i++) {
                threads.emplace_back([i, this](){ run(i); });
            }
        }

        worker_pool(const worker_pool&) = delete;
        worker_pool& operator=(const worker_pool&) = delete;

        // Drains queued tasks before joining
        ~worker_pool() {
            {
                std::lock_guard<std::mutex> lock(task_mutex);
                stopping = true;
            }
            task_available.notify_all();
            for(auto& t : threads) {
                t.join();
            }
        }

        void finish_all() {
            std::unique_lock<std::mutex> lock(task_mutex);
            finished.wait(lock, [&](){ return tasks_left == 0; });
        }

        // The future carries any exception the worker threw
        template<typename... ArgTs>
        std::future<void> post_task(ArgTs&&... args) {
            std::packaged_task<void(T&)> task{
                [args = std::make_tuple(std::forward<ArgTs>(args)...)](T& worker) mutable {
                    std::apply(worker, std::move(args));
                }
            };
            std::future<void> done = task.get_future();
            {
                std::lock_guard<std::mutex> lock(task_mutex);
                tasks.push_back(std::move(task));
                tasks_left++;
            }
            task_available.notify_one();
            return done;
        }
    };
}
#endif
