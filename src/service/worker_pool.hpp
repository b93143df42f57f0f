// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef __SERVICE_WORKER_POOL_HPP__
#define __SERVICE_WORKER_POOL_HPP__

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>
#include <stout/synchronized.hpp>

namespace gridware {
namespace internal {

// A fixed set of threads running the functions posted to it in FIFO
// order.
//
// The threads are plain threads rather than libprocess processes so
// that long running or blocking handlers do not occupy the libprocess
// worker threads.
class WorkerPool
{
public:
  typedef lambda::function<void()> Func;

  explicit WorkerPool(size_t workers)
  {
    for (size_t i = 0; i < workers; i++) {
      threads.emplace_back(new std::thread(&WorkerPool::loop, this));
    }
  }

  ~WorkerPool()
  {
    // Shutdown the queue, which drops the functions not yet started.
    queue.shutdown();

    foreach (const std::unique_ptr<std::thread>& thread, threads) {
      thread->join();
    }
  }

  // Returns false if the pool has been shut down.
  bool post(Func&& func)
  {
    return queue.put(std::move(func));
  }

  size_t size() const { return threads.size(); }

private:
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void loop()
  {
    for (;;) {
      Option<Func> func = queue.get();

      // Stop the thread if the queue is shutdowned.
      if (func.isNone()) {
        break;
      }

      func.get()();
    }
  }

  // ProcessingQueue::get() blocks the calling thread until an element
  // is available or the queue is shut down.
  template <typename T>
  class ProcessingQueue
  {
  public:
    ProcessingQueue() : finished(false) {}

    // Add an element to the queue and notify one client.
    bool put(T&& t)
    {
      synchronized (mutex) {
        if (finished) {
          return false;
        }

        queue.push(std::forward<T>(t));
        cond.notify_one();
        return true;
      }
    }

    // Returns the oldest element from the queue or None() if the
    // queue is shutdowned.
    Option<T> get()
    {
      synchronized (mutex) {
        // Wait for either a new queue element or queue shutdown.
        while (queue.empty() && !finished) {
          synchronized_wait(&cond, &mutex);
        }

        if (finished) {
          return None();
        }

        T t = std::move(queue.front());
        queue.pop();
        return Some(std::move(t));
      }
    }

    // Shutdown the queue and notify all clients.
    void shutdown()
    {
      synchronized (mutex) {
        finished = true;
        std::queue<T>().swap(queue);
        cond.notify_all();
      }
    }

  private:
    std::mutex mutex;
    std::condition_variable cond;
    std::queue<T> queue;
    bool finished;
  };

  ProcessingQueue<Func> queue;
  std::vector<std::unique_ptr<std::thread>> threads;
};

} // namespace internal {
} // namespace gridware {

#endif // __SERVICE_WORKER_POOL_HPP__
