#include <iostream>
#include <thread>
#include <vector>

#include <qx/qx.hpp>

int main()
{
    constexpr int n_blocking = 2;
    constexpr int n_loops = 2;
    constexpr int n_increments = 10000;

    qx::qutex<int> counter(0);
    std::vector<std::thread> workers;

    // plain std::threads park until their request is granted
    for (int i = 0; i < n_blocking; i++)
    {
        workers.emplace_back(
            [counter]
            {
                for (int j = 0; j < n_increments; j++)
                {
                    auto guard = counter.lock().wait().unwrap();
                    *guard += 1;
                }
            });
    }

    // each event loop runs two qx::threads that suspend while waiting for the lock
    for (int i = 0; i < n_loops; i++)
    {
        workers.emplace_back(
            [counter]
            {
                qx::loop(
                    [counter]() -> qx::func<void>
                    {
                        auto incrementer = [counter]() -> qx::func<void>
                        {
                            for (int j = 0; j < n_increments; j++)
                            {
                                auto res = co_await counter.lock();
                                *res.unwrap() += 1;
                            }
                        };
                        auto th1 = qx::thread(incrementer);
                        auto th2 = qx::thread(incrementer);
                        co_await th1.join();
                        co_await th2.join();
                        std::cout << "event loop " << qx::this_thread::name() << " is done\n";
                    });
            });
    }

    for (auto& worker : workers)
        worker.join();

    auto guard = counter.lock().wait().unwrap();
    std::cout << "counter = " << *guard << " (expected " << (n_blocking + 2 * n_loops) * n_increments << ")\n";
    return 0;
}
