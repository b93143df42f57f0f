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


#ifndef __MATCHER_JOB_QUEUE_HPP__
#define __MATCHER_JOB_QUEUE_HPP__

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <gridware/gridware.hpp>
#include <gridware/outcome.hpp>

#include <process/time.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "matcher/requirements.hpp"

namespace gridware {
namespace internal {

// The set of jobs known to the matcher. Waiting jobs are ordered by
// priority (highest first), then submission time, then submission
// sequence.
//
// Every job moves through the states
//
//   WAITING -> MATCHED -> RUNNING -> DONE | FAILED
//
// where a MATCHED job can be released back to WAITING and a WAITING
// or MATCHED job can be KILLED. The WAITING -> MATCHED transition is a
// single compare-and-swap, so each claim succeeds for exactly one
// caller.
//
// Scanning for candidates never holds a lock on the queue: candidates
// are drawn from an immutable snapshot of the waiting jobs, and jobs
// claimed after the snapshot was taken are skipped lazily.
class JobQueue
{
private:
  struct Record;

  typedef std::vector<std::shared_ptr<Record>> Snapshot;

public:
  // A lazy, restartable sequence of the waiting jobs a resource can
  // run, in queue order.
  class Candidates
  {
  public:
    // Returns the next candidate, or None once the snapshot is
    // exhausted.
    Option<JobInfo> next();

    // Restarts the sequence from the first candidate.
    void reset() { position = 0; }

  private:
    friend class JobQueue;

    Candidates(
        const std::shared_ptr<const Snapshot>& _snapshot,
        const ResourceInfo& _resource,
        const SiteAccess& _access)
      : snapshot(_snapshot),
        resource(_resource),
        access(_access),
        position(0) {}

    std::shared_ptr<const Snapshot> snapshot;
    ResourceInfo resource;
    SiteAccess access;
    size_t position;
  };

  JobQueue() : sequence(0) {}

  // Validates the job, assigns its ID and submission time and queues
  // it as WAITING. A job repeating the owner and idempotency token of
  // an earlier job is not queued again; the earlier ID is returned.
  Outcome<JobID> enqueue(const JobInfo& job);

  Candidates peekCandidates(
      const ResourceInfo& resource,
      const SiteAccess& access = SiteAccess()) const;

  // WAITING -> MATCHED. Fails with ALREADY_MATCHED if the job is no
  // longer waiting.
  Outcome<JobInfo> claim(const JobID& jobId, const ResourceID& resourceId);

  // MATCHED -> WAITING, keeping the position of the job in the queue.
  Outcome<Nothing> release(const JobID& jobId);

  // MATCHED -> RUNNING.
  Outcome<Nothing> start(const JobID& jobId);

  // MATCHED | RUNNING -> DONE | FAILED.
  Outcome<Nothing> complete(
      const JobID& jobId,
      const JobState& state,
      const std::string& message = "");

  // WAITING | MATCHED -> KILLED.
  Outcome<Nothing> kill(const JobID& jobId, const std::string& message = "");

  Outcome<JobInfo> get(const JobID& jobId) const;

  Outcome<JobStatus> status(const JobID& jobId) const;

  // Returns the jobs matched to, but not yet started by, a resource.
  std::vector<JobID> matchedTo(const ResourceID& resourceId) const;

  // Forgets the DONE, FAILED and KILLED jobs last updated before
  // 'before', together with their idempotency tokens. Returns the
  // number of jobs forgotten. Until purged, finished jobs stay
  // queryable and their tokens keep deduplicating submissions.
  size_t purge(const process::Time& before);

  size_t size() const;

  size_t waiting() const;

private:
  struct Record
  {
    Record(const JobInfo& _info, uint64_t _sequence)
      : info(_info),
        sequence(_sequence),
        state(JOB_WAITING) {}

    // The job as queued; 'state' and 'resource_id' are not kept here.
    const JobInfo info;
    const uint64_t sequence;

    // Read without holding 'mutex'; written with 'mutex' held.
    std::atomic<int> state;

    std::mutex mutex;
    Option<ResourceID> resource;
    std::string message;
    process::Time updated;
  };

  struct Order
  {
    bool operator()(
        const std::shared_ptr<Record>& left,
        const std::shared_ptr<Record>& right) const;
  };

  Outcome<std::shared_ptr<Record>> find(const JobID& jobId) const;

  static JobInfo view(const std::shared_ptr<Record>& record);

  // Lock order: a record's mutex before 'mutex'.
  mutable std::mutex mutex;
  hashmap<JobID, std::shared_ptr<Record>> records;
  std::set<std::shared_ptr<Record>, Order> queue;
  hashmap<std::string, JobID> tokens;
  uint64_t sequence;

  // Rebuilt from 'queue' on demand; reset whenever 'queue' changes.
  mutable std::shared_ptr<const Snapshot> snapshot;
};

} // namespace internal {
} // namespace gridware {

#endif // __MATCHER_JOB_QUEUE_HPP__
