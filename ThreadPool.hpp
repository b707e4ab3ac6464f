// File: ThreadPool.hpp
// Description: Small fixed-size worker pool for blocking work (database
// calls) so it never runs on an Asio thread.
#pragma once
#include <condition_variable>
#include <functional>
#include <iostream>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

class ThreadPool {
public:
	explicit ThreadPool(size_t threads)
		: state_(std::make_shared<State>())
	{
		if (threads == 0) threads = 1;
		for (size_t i = 0; i < threads; ++i)
		{
			// Workers own the queue state, not the pool; a task may drop the last pool owner.
			workers_.emplace_back([state = state_] {
				for (;;)
				{
					std::function<void()> task;
					{
						std::unique_lock<std::mutex> lock(state->mutex);
						state->condition.wait(lock, [&state] { return state->stop || !state->tasks.empty(); });
						// Drain what is left before exiting
						if (state->stop && state->tasks.empty())
							return;
						task = std::move(state->tasks.front());
						state->tasks.pop();
						++state->active;
					}

					task();
					// Release whatever the task captured before reporting idle
					task = nullptr;

					{
						std::lock_guard<std::mutex> lock(state->mutex);
						--state->active;
						if (state->tasks.empty() && state->active == 0)
							state->idle.notify_all();
					}
				}
				});
		}
	}

	ThreadPool(const ThreadPool&) = delete;
	ThreadPool& operator=(const ThreadPool&) = delete;

	template<class F>
	auto enqueue(F&& f) -> std::future<decltype(f())>
	{
		using return_type = decltype(f());

		auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
		std::future<return_type> res = task->get_future();
		{
			std::lock_guard<std::mutex> lock(state_->mutex);
			if (state_->stop)
				throw std::runtime_error("enqueue on stopped ThreadPool");
			state_->tasks.emplace([task]() { (*task)(); });
		}
		state_->condition.notify_one();
		return res;
	}

	// Blocks until the queue is empty and no task is running.
	void wait_idle()
	{
		std::unique_lock<std::mutex> lock(state_->mutex);
		state_->idle.wait(lock, [this] { return state_->tasks.empty() && state_->active == 0; });
	}

	~ThreadPool()
	{
		{
			std::lock_guard<std::mutex> lock(state_->mutex);
			state_->stop = true;
		}
		state_->condition.notify_all();
		for (std::thread& worker : workers_)
		{
			// A worker cannot join itself; it exits on its own once the queue is empty.
			if (worker.get_id() == std::this_thread::get_id())
			{
				std::cerr << "[POOL] ThreadPool released from one of its workers" << std::endl;
				worker.detach();
			}
			else
				worker.join();
		}
	}

private:
	struct State {
		std::queue<std::function<void()>> tasks;
		std::mutex mutex;
		std::condition_variable condition;
		std::condition_variable idle;
		size_t active = 0;
		bool stop = false;
	};

	std::shared_ptr<State> state_;
	std::vector<std::thread> workers_;
};
