#include <gtest/gtest.h>
#include <pdf_outline/thread_pool.h>
#include <chrono>
#include <atomic>
#include <string>

TEST(ThreadPoolTest, BasicConstruction) {
    EXPECT_NO_THROW(pdf_outline::ThreadPool pool(4));
}

TEST(ThreadPoolTest, ZeroSelectsHardwareConcurrency) {
    pdf_outline::ThreadPool pool(0);
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(ThreadPoolTest, SingleTask) {
    pdf_outline::ThreadPool pool(2);

    auto future = pool.enqueue([]() { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, ResultsFollowSubmissionOrder) {
    pdf_outline::ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([i]() { return i * i; }));
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ArgumentsAreForwarded) {
    pdf_outline::ThreadPool pool(2);

    auto future = pool.enqueue([](const std::string& name, int page) {
        return name + ":" + std::to_string(page);
    }, std::string("report.pdf"), 3);
    EXPECT_EQ(future.get(), "report.pdf:3");
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    pdf_outline::ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    auto start = std::chrono::steady_clock::now();

    // Submit tasks that sleep briefly
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.enqueue([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            counter++;
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    EXPECT_EQ(counter, 8);
    // Serial execution would need 400ms
    EXPECT_LT(duration.count(), 350);
}

TEST(ThreadPoolTest, ExceptionHandling) {
    pdf_outline::ThreadPool pool(2);

    auto future = pool.enqueue([]() -> int {
        throw std::runtime_error("Test exception");
    });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> completed{0};
    {
        pdf_outline::ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&completed]() { completed++; });
        }
    }
    EXPECT_EQ(completed, 20);
}
