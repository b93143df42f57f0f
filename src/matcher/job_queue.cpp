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


#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "matcher/job_queue.hpp"
#include "matcher/validation.hpp"

using process::Clock;

using std::shared_ptr;
using std::string;
using std::vector;

namespace gridware {
namespace internal {

bool JobQueue::Order::operator()(
    const shared_ptr<Record>& left,
    const shared_ptr<Record>& right) const
{
  if (left->info.priority() != right->info.priority()) {
    return left->info.priority() > right->info.priority();
  }

  if (left->info.submitted() != right->info.submitted()) {
    return left->info.submitted() < right->info.submitted();
  }

  return left->sequence < right->sequence;
}


Option<JobInfo> JobQueue::Candidates::next()
{
  while (position < snapshot->size()) {
    const shared_ptr<Record>& record = snapshot->at(position++);

    // Claimed or killed since the snapshot was taken.
    if (record->state.load() != JOB_WAITING) {
      continue;
    }

    if (!satisfies(resource, record->info)) {
      continue;
    }

    if (!access.permitted(record->info.group(), resource.site())) {
      continue;
    }

    return view(record);
  }

  return None();
}


Outcome<JobID> JobQueue::enqueue(const JobInfo& job)
{
  Option<Error> error = validation::job::validate(job);
  if (error.isSome()) {
    return GridError(ErrorInfo::INVALID_JOB, error->message);
  }

  JobInfo info = job;
  info.clear_state();
  info.clear_resource_id();
  info.set_submitted(Clock::now().secs());

  synchronized (mutex) {
    Option<string> token;
    if (job.has_idempotency_token()) {
      token = job.owner() + '\0' + job.idempotency_token();

      if (tokens.contains(token.get())) {
        VLOG(1) << "Job " << tokens.at(token.get()) << " of '" << job.owner()
                << "' already submitted with token '"
                << job.idempotency_token() << "'";

        return tokens.at(token.get());
      }
    }

    const uint64_t number = ++sequence;

    info.mutable_job_id()->set_value(stringify(number));

    shared_ptr<Record> record(new Record(info, number));
    record->updated = Clock::now();

    records[info.job_id()] = record;
    queue.insert(record);
    snapshot.reset();

    if (token.isSome()) {
      tokens[token.get()] = info.job_id();
    }
  }

  VLOG(1) << "Queued job " << info.job_id() << " of '" << info.owner()
          << "' in group '" << info.group() << "' with priority "
          << info.priority();

  return info.job_id();
}


JobQueue::Candidates JobQueue::peekCandidates(
    const ResourceInfo& resource,
    const SiteAccess& access) const
{
  shared_ptr<const Snapshot> current;

  synchronized (mutex) {
    if (!snapshot) {
      snapshot.reset(new Snapshot(queue.begin(), queue.end()));
    }

    current = snapshot;
  }

  return Candidates(current, resource, access);
}


Outcome<JobInfo> JobQueue::claim(
    const JobID& jobId,
    const ResourceID& resourceId)
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  synchronized (job->mutex) {
    int expected = JOB_WAITING;
    if (!job->state.compare_exchange_strong(expected, JOB_MATCHED)) {
      return GridError(
          ErrorInfo::ALREADY_MATCHED,
          "Job " + stringify(jobId) + " is " +
          stringify(static_cast<JobState>(expected)));
    }

    job->resource = resourceId;
    job->updated = Clock::now();

    synchronized (mutex) {
      queue.erase(job);
      snapshot.reset();
    }
  }

  VLOG(1) << "Matched job " << jobId << " to resource " << resourceId;

  return view(job);
}


Outcome<Nothing> JobQueue::release(const JobID& jobId)
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  synchronized (job->mutex) {
    if (job->state.load() != JOB_MATCHED) {
      return GridError(
          ErrorInfo::INVALID_JOB,
          "Job " + stringify(jobId) + " is " +
          stringify(static_cast<JobState>(job->state.load())) +
          " and cannot be released");
    }

    job->state = JOB_WAITING;
    job->resource = None();
    job->updated = Clock::now();

    // The record keeps its priority, submission time and sequence, so
    // the job returns to its original position.
    synchronized (mutex) {
      queue.insert(job);
      snapshot.reset();
    }
  }

  VLOG(1) << "Released job " << jobId;

  return Nothing();
}


Outcome<Nothing> JobQueue::start(const JobID& jobId)
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  synchronized (job->mutex) {
    const JobState state = static_cast<JobState>(job->state.load());

    if (state == JOB_RUNNING) {
      return Nothing();
    }

    if (state != JOB_MATCHED) {
      return GridError(
          ErrorInfo::INVALID_JOB,
          "Job " + stringify(jobId) + " is " + stringify(state) +
          " and cannot be started");
    }

    job->state = JOB_RUNNING;
    job->updated = Clock::now();
  }

  return Nothing();
}


Outcome<Nothing> JobQueue::complete(
    const JobID& jobId,
    const JobState& outcome,
    const string& message)
{
  if (outcome != JOB_DONE && outcome != JOB_FAILED) {
    return GridError(
        ErrorInfo::INVALID_JOB,
        "Expecting JOB_DONE or JOB_FAILED instead of " + stringify(outcome));
  }

  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  synchronized (job->mutex) {
    const JobState state = static_cast<JobState>(job->state.load());

    if (state != JOB_MATCHED && state != JOB_RUNNING) {
      return GridError(
          ErrorInfo::INVALID_JOB,
          "Job " + stringify(jobId) + " is " + stringify(state) +
          " and cannot be completed");
    }

    job->state = outcome;
    job->message = message;
    job->updated = Clock::now();
  }

  VLOG(1) << "Job " << jobId << " finished in state " << outcome;

  return Nothing();
}


Outcome<Nothing> JobQueue::kill(const JobID& jobId, const string& message)
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  synchronized (job->mutex) {
    const JobState state = static_cast<JobState>(job->state.load());

    if (state != JOB_WAITING && state != JOB_MATCHED) {
      return GridError(
          ErrorInfo::INVALID_JOB,
          "Job " + stringify(jobId) + " is " + stringify(state) +
          " and cannot be killed");
    }

    job->state = JOB_KILLED;
    job->message = message;
    job->updated = Clock::now();

    if (state == JOB_WAITING) {
      synchronized (mutex) {
        queue.erase(job);
        snapshot.reset();
      }
    }
  }

  VLOG(1) << "Killed job " << jobId;

  return Nothing();
}


Outcome<JobInfo> JobQueue::get(const JobID& jobId) const
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  return view(record.get());
}


Outcome<JobStatus> JobQueue::status(const JobID& jobId) const
{
  Outcome<shared_ptr<Record>> record = find(jobId);
  if (record.isError()) {
    return record.error();
  }

  const shared_ptr<Record>& job = record.get();

  JobStatus status;
  status.mutable_job_id()->CopyFrom(jobId);

  synchronized (job->mutex) {
    status.set_state(static_cast<JobState>(job->state.load()));
    status.set_timestamp(job->updated.secs());

    if (!job->message.empty()) {
      status.set_message(job->message);
    }

    if (job->resource.isSome()) {
      status.mutable_resource_id()->CopyFrom(job->resource.get());
    }
  }

  return status;
}


vector<JobID> JobQueue::matchedTo(const ResourceID& resourceId) const
{
  vector<shared_ptr<Record>> all;

  synchronized (mutex) {
    foreachvalue (const shared_ptr<Record>& record, records) {
      all.push_back(record);
    }
  }

  vector<JobID> result;

  foreach (const shared_ptr<Record>& record, all) {
    if (record->state.load() != JOB_MATCHED) {
      continue;
    }

    synchronized (record->mutex) {
      if (record->state.load() == JOB_MATCHED &&
          record->resource.isSome() &&
          record->resource.get() == resourceId) {
        result.push_back(record->info.job_id());
      }
    }
  }

  return result;
}


size_t JobQueue::purge(const process::Time& before)
{
  vector<shared_ptr<Record>> all;

  synchronized (mutex) {
    foreachvalue (const shared_ptr<Record>& record, records) {
      all.push_back(record);
    }
  }

  // Terminal states are final, so a job found terminal here stays so.
  hashset<JobID> finished;

  foreach (const shared_ptr<Record>& record, all) {
    synchronized (record->mutex) {
      const int state = record->state.load();
      if ((state == JOB_DONE || state == JOB_FAILED || state == JOB_KILLED) &&
          record->updated < before) {
        finished.insert(record->info.job_id());
      }
    }
  }

  if (finished.empty()) {
    return 0;
  }

  synchronized (mutex) {
    foreach (const JobID& jobId, finished) {
      records.erase(jobId);
    }

    vector<string> stale;
    foreachpair (const string& token, const JobID& jobId, tokens) {
      if (finished.contains(jobId)) {
        stale.push_back(token);
      }
    }

    foreach (const string& token, stale) {
      tokens.erase(token);
    }
  }

  VLOG(1) << "Purged " << finished.size() << " finished job(s)";

  return finished.size();
}


size_t JobQueue::size() const
{
  synchronized (mutex) {
    return records.size();
  }
}


size_t JobQueue::waiting() const
{
  synchronized (mutex) {
    return queue.size();
  }
}


Outcome<shared_ptr<JobQueue::Record>> JobQueue::find(const JobID& jobId) const
{
  synchronized (mutex) {
    if (!records.contains(jobId)) {
      return GridError(
          ErrorInfo::INVALID_JOB,
          "Unknown job " + stringify(jobId));
    }

    return records.at(jobId);
  }
}


JobInfo JobQueue::view(const shared_ptr<Record>& record)
{
  JobInfo info = record->info;

  synchronized (record->mutex) {
    info.set_state(static_cast<JobState>(record->state.load()));

    if (record->resource.isSome()) {
      info.mutable_resource_id()->CopyFrom(record->resource.get());
    }
  }

  return info;
}

} // namespace internal {
} // namespace gridware {
