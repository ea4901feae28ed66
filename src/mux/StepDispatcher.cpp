#include "StepDispatcher.hpp"

namespace pmx {
string dispatchStatusToString(DispatchStatus status) {
  switch (status) {
    case DispatchStatus::COMPLETED:
      return "completed";
    case DispatchStatus::CANCELLED:
      return "cancelled";
    case DispatchStatus::BACKEND_UNAVAILABLE:
      return "backend unavailable";
    case DispatchStatus::PANE_CLOSED:
      return "pane closed";
  }
  return "unknown";
}

StepDispatcher::StepDispatcher(shared_ptr<EventLoop> _loop,
                               shared_ptr<SessionRegistry> _registry,
                               const WorkspaceConfig& config)
    : loop(_loop),
      registry(_registry),
      activityTracker(_registry->getActivityTracker()),
      idlePollIntervalMs(config.idlePollIntervalMs),
      idleWaitCeilingMs(config.idleWaitCeilingMs),
      handleWaitCeilingMs(config.handleWaitCeilingMs),
      running(0),
      lifetimeToken(new bool(true)) {}

StepDispatcher::~StepDispatcher() {
  if (running) {
    LOG(INFO) << "Dropping " << running << " unfinished step sequences";
  }
}

void StepDispatcher::dispatch(PaneId paneId, const vector<string>& steps,
                              CancelFlag cancelFlag, Callback callback) {
  shared_ptr<Job> job(new Job());
  job->paneId = paneId;
  job->steps = steps;
  job->nextStep = 0;
  job->waitStartedMs = loop->getClock()->nowMs();
  job->cancelFlag = cancelFlag ? cancelFlag : makeCancelFlag();
  job->callback = callback;
  running++;
  LOG(INFO) << "Dispatching " << steps.size() << " steps to "
            << paneIdToString(paneId);
  weak_ptr<bool> alive(lifetimeToken);
  loop->post([this, alive, job]() {
    if (!alive.expired()) {
      waitForHandle(job);
    }
  });
}

void StepDispatcher::schedule(
    const shared_ptr<Job>& job,
    void (StepDispatcher::*fn)(const shared_ptr<Job>&)) {
  weak_ptr<bool> alive(lifetimeToken);
  loop->postDelayed(idlePollIntervalMs, [this, alive, job, fn]() {
    if (!alive.expired()) {
      (this->*fn)(job);
    }
  });
}

void StepDispatcher::waitForHandle(const shared_ptr<Job>& job) {
  if (job->cancelFlag->load()) {
    finish(job, DispatchStatus::CANCELLED);
    return;
  }
  shared_ptr<Session> session = registry->get(job->paneId);
  if (session && session->isLive()) {
    sendNextStep(job);
    return;
  }
  if (session && (session->hasFailed() || session->hasExited())) {
    finish(job, DispatchStatus::BACKEND_UNAVAILABLE);
    return;
  }
  int64_t waited = loop->getClock()->nowMs() - job->waitStartedMs;
  if (waited >= handleWaitCeilingMs) {
    LOG(WARNING) << "Gave up waiting for a backend on "
                 << paneIdToString(job->paneId);
    finish(job, DispatchStatus::BACKEND_UNAVAILABLE);
    return;
  }
  schedule(job, &StepDispatcher::waitForHandle);
}

void StepDispatcher::sendNextStep(const shared_ptr<Job>& job) {
  if (job->cancelFlag->load()) {
    finish(job, DispatchStatus::CANCELLED);
    return;
  }
  if (job->nextStep >= job->steps.size()) {
    finish(job, DispatchStatus::COMPLETED);
    return;
  }
  if (!checkSession(job)) {
    return;
  }
  VLOG(1) << "Step " << job->nextStep + 1 << "/" << job->steps.size()
          << " to " << paneIdToString(job->paneId);
  registry->writeInput(job->paneId, job->steps[job->nextStep] + "\r");
  job->waitStartedMs = loop->getClock()->nowMs();
  schedule(job, &StepDispatcher::pollIdle);
}

void StepDispatcher::pollIdle(const shared_ptr<Job>& job) {
  if (job->cancelFlag->load()) {
    finish(job, DispatchStatus::CANCELLED);
    return;
  }
  if (!checkSession(job)) {
    return;
  }
  if (!activityTracker->isActive(job->paneId)) {
    job->result.steps.push_back(StepOutcome::IDLE);
    job->nextStep++;
    sendNextStep(job);
    return;
  }
  int64_t waited = loop->getClock()->nowMs() - job->waitStartedMs;
  if (waited >= idleWaitCeilingMs) {
    LOG(WARNING) << "Step " << job->nextStep + 1 << " on "
                 << paneIdToString(job->paneId)
                 << " still busy after " << waited << "ms, moving on";
    job->result.steps.push_back(StepOutcome::TIMED_OUT);
    job->nextStep++;
    sendNextStep(job);
    return;
  }
  schedule(job, &StepDispatcher::pollIdle);
}

bool StepDispatcher::checkSession(const shared_ptr<Job>& job) {
  shared_ptr<Session> session = registry->get(job->paneId);
  if (!session) {
    finish(job, DispatchStatus::PANE_CLOSED);
    return false;
  }
  if (!session->isLive()) {
    // The pane is still open but its shell is gone
    finish(job, DispatchStatus::BACKEND_UNAVAILABLE);
    return false;
  }
  return true;
}

void StepDispatcher::finish(const shared_ptr<Job>& job,
                            DispatchStatus status) {
  job->result.status = status;
  running--;
  LOG(INFO) << "Step sequence on " << paneIdToString(job->paneId)
            << " finished: " << dispatchStatusToString(status);
  if (job->callback) {
    job->callback(job->result);
  }
}
}  // namespace pmx
