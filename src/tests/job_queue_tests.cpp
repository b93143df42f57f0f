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


#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <gridware/gridware.hpp>

#include <process/clock.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/stopwatch.hpp>
#include <stout/stringify.hpp>

#include "matcher/job_queue.hpp"
#include "matcher/requirements.hpp"

#include "tests/assert.hpp"
#include "tests/utils.hpp"

using process::Clock;

using std::string;
using std::vector;

namespace gridware {
namespace internal {
namespace tests {

// Returns the IDs of the candidates, in order.
static vector<string> candidateIds(
    const JobQueue& queue,
    const ResourceInfo& resource)
{
  vector<string> ids;

  JobQueue::Candidates candidates = queue.peekCandidates(resource);
  for (Option<JobInfo> job = candidates.next();
       job.isSome();
       job = candidates.next()) {
    ids.push_back(job->job_id().value());
  }

  return ids;
}


TEST(JobQueueTest, Enqueue)
{
  JobQueue queue;

  JobInfo job = createJob("dteam_user");
  job.mutable_job_id()->set_value("forged");
  job.set_state(JOB_DONE);

  Outcome<JobID> jobId = queue.enqueue(job);
  ASSERT_SOME(jobId);
  EXPECT_NE("forged", jobId->value());

  Outcome<JobInfo> queued = queue.get(jobId.get());
  ASSERT_SOME(queued);
  EXPECT_EQ(JOB_WAITING, queued->state());
  EXPECT_TRUE(queued->has_submitted());
  EXPECT_EQ("dteam_user", queued->group());

  EXPECT_EQ(1u, queue.size());
  EXPECT_EQ(1u, queue.waiting());
}


TEST(JobQueueTest, EnqueueInvalid)
{
  JobQueue queue;

  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.enqueue(createJob("")));

  JobInfo job = createJob("dteam_user");
  job.mutable_requirements()->add_sites("LCG.CERN.ch");
  job.mutable_requirements()->add_banned_sites("LCG.CERN.ch");

  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.enqueue(job));

  job = createJob("dteam_user");
  job.mutable_requirements()->add_tags(" ");

  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.enqueue(job));

  EXPECT_EQ(0u, queue.size());
}


// Submitting again with the same token returns the first job.
TEST(JobQueueTest, Idempotency)
{
  JobQueue queue;

  JobInfo job = createJob("dteam_user");
  job.set_idempotency_token("b1946ac9");

  Outcome<JobID> first = queue.enqueue(job);
  ASSERT_SOME(first);

  Outcome<JobID> second = queue.enqueue(job);
  ASSERT_SOME(second);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(1u, queue.size());

  // Tokens are scoped by owner.
  JobInfo other = createJob("dteam_user", 0, "/O=Grid/OU=Users/CN=bob");
  other.set_idempotency_token("b1946ac9");

  Outcome<JobID> third = queue.enqueue(other);
  ASSERT_SOME(third);
  EXPECT_NE(first.get(), third.get());
  EXPECT_EQ(2u, queue.size());
}


// Higher priority first, then submission order.
TEST(JobQueueTest, Order)
{
  Clock::pause();

  JobQueue queue;

  Outcome<JobID> low = queue.enqueue(createJob("dteam_user", 0));
  Clock::advance(Seconds(1));
  Outcome<JobID> high = queue.enqueue(createJob("dteam_user", 5));
  Clock::advance(Seconds(1));
  Outcome<JobID> older = queue.enqueue(createJob("dteam_user", 1));
  Outcome<JobID> newer = queue.enqueue(createJob("dteam_user", 1));

  ASSERT_SOME(low);
  ASSERT_SOME(high);
  ASSERT_SOME(older);
  ASSERT_SOME(newer);

  EXPECT_EQ(
      vector<string>({
          high->value(),
          older->value(),
          newer->value(),
          low->value()}),
      candidateIds(queue, createResource("r1")));

  Clock::resume();
}


TEST(JobQueueTest, CandidatesFilter)
{
  JobQueue queue;

  JobInfo x86 = createJob("dteam_user");
  x86.mutable_requirements()->set_platform("Linux_x86_64");

  JobInfo arm = createJob("dteam_user");
  arm.mutable_requirements()->set_platform("Linux_aarch64");

  JobInfo gpu = createJob("dteam_user");
  gpu.mutable_requirements()->add_tags("GPU");

  JobInfo banned = createJob("dteam_user");
  banned.mutable_requirements()->add_banned_sites("LCG.CERN.ch");

  Outcome<JobID> x86Id = queue.enqueue(x86);
  ASSERT_SOME(x86Id);
  ASSERT_SOME(queue.enqueue(arm));
  ASSERT_SOME(queue.enqueue(gpu));
  ASSERT_SOME(queue.enqueue(banned));

  EXPECT_EQ(
      vector<string>({x86Id->value()}),
      candidateIds(queue, createResource("r1")));

  ResourceInfo elsewhere = createResource("r2", "LCG.PIC.es", "Linux_aarch64");
  elsewhere.add_tags("GPU");

  EXPECT_EQ(3u, candidateIds(queue, elsewhere).size());
}


TEST(JobQueueTest, CandidatesSiteAccess)
{
  JobQueue queue;

  ASSERT_SOME(queue.enqueue(createJob("dteam_user")));
  ASSERT_SOME(queue.enqueue(createJob("lhcb_user")));

  SiteAccess access(configuration(R"~(
      {
        "Resources": {
          "Sites": {
            "LCG.CERN.ch": { "AllowedGroups": "lhcb_user" }
          }
        }
      })~"));

  JobQueue::Candidates candidates =
    queue.peekCandidates(createResource("r1"), access);

  Option<JobInfo> job = candidates.next();
  ASSERT_SOME(job);
  EXPECT_EQ("lhcb_user", job->group());
  EXPECT_NONE(candidates.next());

  // Other sites admit every group.
  candidates = queue.peekCandidates(createResource("r2", "LCG.PIC.es"), access);
  EXPECT_SOME(candidates.next());
  EXPECT_SOME(candidates.next());
  EXPECT_NONE(candidates.next());
}


// A snapshot skips jobs claimed after it was taken.
TEST(JobQueueTest, CandidatesSkipClaimed)
{
  JobQueue queue;

  Outcome<JobID> first = queue.enqueue(createJob("dteam_user"));
  Outcome<JobID> second = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(first);
  ASSERT_SOME(second);

  ResourceInfo resource = createResource("r1");

  JobQueue::Candidates candidates = queue.peekCandidates(resource);

  ResourceID other;
  other.set_value("r2");
  ASSERT_SOME(queue.claim(first.get(), other));

  Option<JobInfo> job = candidates.next();
  ASSERT_SOME(job);
  EXPECT_EQ(second.get(), job->job_id());
  EXPECT_NONE(candidates.next());

  // Restarting walks the same snapshot again.
  candidates.reset();
  job = candidates.next();
  ASSERT_SOME(job);
  EXPECT_EQ(second.get(), job->job_id());
}


TEST(JobQueueTest, Claim)
{
  JobQueue queue;

  Outcome<JobID> jobId = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(jobId);

  ResourceID r1;
  r1.set_value("r1");

  ResourceID r2;
  r2.set_value("r2");

  Outcome<JobInfo> claimed = queue.claim(jobId.get(), r1);
  ASSERT_SOME(claimed);
  EXPECT_EQ(JOB_MATCHED, claimed->state());
  EXPECT_EQ(r1, claimed->resource_id());

  EXPECT_EQ(0u, queue.waiting());

  EXPECT_FAILED_WITH(ErrorInfo::ALREADY_MATCHED, queue.claim(jobId.get(), r2));
  EXPECT_FAILED_WITH(ErrorInfo::ALREADY_MATCHED, queue.claim(jobId.get(), r1));

  EXPECT_EQ(vector<JobID>({jobId.get()}), queue.matchedTo(r1));
  EXPECT_TRUE(queue.matchedTo(r2).empty());

  JobID unknown;
  unknown.set_value("unknown");

  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.claim(unknown, r1));
}


// Many resources racing for the same job: exactly one wins.
TEST(JobQueueTest, ConcurrentClaim)
{
  JobQueue queue;

  const size_t jobs = 16;
  const size_t threads = 8;

  vector<JobID> jobIds;
  for (size_t i = 0; i < jobs; i++) {
    Outcome<JobID> jobId = queue.enqueue(createJob("dteam_user"));
    ASSERT_SOME(jobId);
    jobIds.push_back(jobId.get());
  }

  std::atomic<size_t> claimed(0);
  std::atomic<size_t> refused(0);
  std::atomic<size_t> failed(0);

  vector<std::thread> racers;
  for (size_t i = 0; i < threads; i++) {
    racers.emplace_back([&, i]() {
      ResourceID resourceId;
      resourceId.set_value("r" + stringify(i));

      foreach (const JobID& jobId, jobIds) {
        Outcome<JobInfo> claim = queue.claim(jobId, resourceId);
        if (claim.isSome()) {
          ++claimed;
        } else if (claim.error().code == ErrorInfo::ALREADY_MATCHED) {
          ++refused;
        } else {
          ++failed;
        }
      }
    });
  }

  foreach (std::thread& racer, racers) {
    racer.join();
  }

  EXPECT_EQ(jobs, claimed.load());
  EXPECT_EQ(jobs * (threads - 1), refused.load());
  EXPECT_EQ(0u, failed.load());
  EXPECT_EQ(0u, queue.waiting());
}


// A released job goes back to its original position.
TEST(JobQueueTest, Release)
{
  JobQueue queue;

  Outcome<JobID> first = queue.enqueue(createJob("dteam_user"));
  Outcome<JobID> second = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(first);
  ASSERT_SOME(second);

  ResourceID resourceId;
  resourceId.set_value("r1");

  ASSERT_SOME(queue.claim(first.get(), resourceId));

  EXPECT_EQ(
      vector<string>({second->value()}),
      candidateIds(queue, createResource("r1")));

  ASSERT_SOME(queue.release(first.get()));

  EXPECT_EQ(
      vector<string>({first->value(), second->value()}),
      candidateIds(queue, createResource("r1")));

  Outcome<JobInfo> job = queue.get(first.get());
  ASSERT_SOME(job);
  EXPECT_EQ(JOB_WAITING, job->state());
  EXPECT_FALSE(job->has_resource_id());

  // Only matched jobs can be released.
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.release(first.get()));
}


TEST(JobQueueTest, Transitions)
{
  JobQueue queue;

  ResourceID resourceId;
  resourceId.set_value("r1");

  Outcome<JobID> jobId = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(jobId);

  // WAITING cannot be started or completed.
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.start(jobId.get()));
  EXPECT_FAILED_WITH(
      ErrorInfo::INVALID_JOB,
      queue.complete(jobId.get(), JOB_DONE));

  ASSERT_SOME(queue.claim(jobId.get(), resourceId));
  ASSERT_SOME(queue.start(jobId.get()));

  // Starting twice is accepted.
  EXPECT_SOME(queue.start(jobId.get()));

  // RUNNING cannot be released or killed.
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.release(jobId.get()));
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.kill(jobId.get()));

  // Only DONE and FAILED complete a job.
  EXPECT_FAILED_WITH(
      ErrorInfo::INVALID_JOB,
      queue.complete(jobId.get(), JOB_KILLED));

  ASSERT_SOME(queue.complete(jobId.get(), JOB_FAILED, "Exit code 1"));

  Outcome<JobStatus> status = queue.status(jobId.get());
  ASSERT_SOME(status);
  EXPECT_EQ(JOB_FAILED, status->state());
  EXPECT_EQ("Exit code 1", status->message());
  EXPECT_EQ(resourceId, status->resource_id());

  // Terminal states are final.
  EXPECT_FAILED_WITH(
      ErrorInfo::INVALID_JOB,
      queue.complete(jobId.get(), JOB_DONE));
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.start(jobId.get()));
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.kill(jobId.get()));
}


TEST(JobQueueTest, Kill)
{
  JobQueue queue;

  ResourceID resourceId;
  resourceId.set_value("r1");

  Outcome<JobID> waiting = queue.enqueue(createJob("dteam_user"));
  Outcome<JobID> matched = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(waiting);
  ASSERT_SOME(matched);

  ASSERT_SOME(queue.claim(matched.get(), resourceId));

  ASSERT_SOME(queue.kill(waiting.get(), "Killed by alice"));
  ASSERT_SOME(queue.kill(matched.get()));

  EXPECT_EQ(0u, queue.waiting());
  EXPECT_EQ(2u, queue.size());

  EXPECT_TRUE(candidateIds(queue, createResource("r2")).empty());

  Outcome<JobStatus> status = queue.status(waiting.get());
  ASSERT_SOME(status);
  EXPECT_EQ(JOB_KILLED, status->state());
  EXPECT_EQ("Killed by alice", status->message());

  // A killed job cannot be claimed.
  EXPECT_FAILED_WITH(
      ErrorInfo::ALREADY_MATCHED,
      queue.claim(waiting.get(), resourceId));

  EXPECT_TRUE(queue.matchedTo(resourceId).empty());
}


// Finished jobs are kept until purged; their tokens go with them.
TEST(JobQueueTest, Purge)
{
  Clock::pause();

  JobQueue queue;

  ResourceID resourceId;
  resourceId.set_value("r1");

  JobInfo job = createJob("dteam_user");
  job.set_idempotency_token("b1946ac9");

  Outcome<JobID> done = queue.enqueue(job);
  Outcome<JobID> killed = queue.enqueue(createJob("dteam_user"));
  Outcome<JobID> running = queue.enqueue(createJob("dteam_user"));
  Outcome<JobID> waiting = queue.enqueue(createJob("dteam_user"));
  ASSERT_SOME(done);
  ASSERT_SOME(killed);
  ASSERT_SOME(running);
  ASSERT_SOME(waiting);

  ASSERT_SOME(queue.claim(done.get(), resourceId));
  ASSERT_SOME(queue.start(done.get()));
  ASSERT_SOME(queue.complete(done.get(), JOB_DONE));
  ASSERT_SOME(queue.kill(killed.get()));
  ASSERT_SOME(queue.claim(running.get(), resourceId));
  ASSERT_SOME(queue.start(running.get()));

  // Nothing finished before now.
  EXPECT_EQ(0u, queue.purge(Clock::now()));
  EXPECT_EQ(4u, queue.size());

  // The token still deduplicates.
  Outcome<JobID> again = queue.enqueue(job);
  ASSERT_SOME(again);
  EXPECT_EQ(done.get(), again.get());

  Clock::advance(Hours(2));

  EXPECT_EQ(2u, queue.purge(Clock::now() - Hours(1)));
  EXPECT_EQ(2u, queue.size());
  EXPECT_EQ(1u, queue.waiting());

  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.status(done.get()));
  EXPECT_FAILED_WITH(ErrorInfo::INVALID_JOB, queue.status(killed.get()));
  EXPECT_SOME(queue.status(running.get()));
  EXPECT_SOME(queue.status(waiting.get()));

  // The token is free again.
  Outcome<JobID> resubmitted = queue.enqueue(job);
  ASSERT_SOME(resubmitted);
  EXPECT_NE(done.get(), resubmitted.get());
  EXPECT_EQ(3u, queue.size());

  Clock::resume();
}


TEST(JobQueueTest, BENCHMARK_EnqueueAndClaim)
{
  JobQueue queue;

  const size_t jobs = 10000;

  Stopwatch watch;
  watch.start();

  for (size_t i = 0; i < jobs; i++) {
    ASSERT_SOME(queue.enqueue(createJob(
        "group" + stringify(i % 16), static_cast<int>(i % 4))));
  }

  std::cout << "Enqueued " << jobs << " jobs in " << watch.elapsed()
            << std::endl;

  ResourceInfo resource = createResource("r1");

  watch.start();

  for (size_t i = 0; i < jobs; i++) {
    JobQueue::Candidates candidates = queue.peekCandidates(resource);

    Option<JobInfo> job = candidates.next();
    ASSERT_SOME(job);
    ASSERT_SOME(queue.claim(job->job_id(), resource.id()));
  }

  std::cout << "Claimed " << jobs << " jobs in " << watch.elapsed()
            << std::endl;
}

} // namespace tests {
} // namespace internal {
} // namespace gridware {
