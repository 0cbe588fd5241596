#include "chatfetch/stream/manager.hpp"

#include "chatfetch/observability/global.hpp"

namespace chatfetch::stream {

std::string_view session_state_name(const SessionState state) {
  switch (state) {
  case SessionState::Disconnected:
    return "disconnected";
  case SessionState::Connected:
    return "connected";
  case SessionState::ReconnectPending:
    return "reconnect_pending";
  case SessionState::Terminated:
    return "terminated";
  }
  return "unknown";
}

ResilienceManager::ResilienceManager(Transport &transport, auth::CredentialProvider &credentials,
                                     BatchSink &sink, CancellationGate &gate,
                                     ManagerOptions options)
    : transport_(transport), credentials_(credentials), sink_(sink), gate_(gate),
      options_(options) {}

RunResult ResilienceManager::run(Cursor cursor) {
  cursor_ = std::move(cursor);
  session_.reset();
  reconnect_deadline_.reset();
  transition(SessionState::Disconnected);

  RunResult outcome = RunResult::success();
  bool initial = true;
  while (true) {
    // Cancellation wins over anything else that may be ready.
    if (gate_.is_cancelled()) {
      terminate(gate_.reason());
      return RunResult::success();
    }

    Step step = Step::Continue;
    switch (state_) {
    case SessionState::Disconnected:
      step = connect(initial, outcome);
      initial = false;
      break;
    case SessionState::Connected:
      step = consume(outcome);
      break;
    case SessionState::ReconnectPending:
      wait_for_deadline();
      break;
    case SessionState::Terminated:
      return outcome;
    }

    if (step == Step::Stop) {
      return outcome;
    }
  }
}

ResilienceManager::Step ResilienceManager::connect(const bool initial, RunResult &outcome) {
  // Credentials may be refreshed between attempts, so they are never reused.
  const auto credential = credentials_.fetch();
  OpenResult opened = credential.ok()
                          ? transport_.open(cursor_, credential.value())
                          : OpenResult::failure(StreamError::connect(
                                "credential unavailable: " + credential.error()));

  if (gate_.is_cancelled()) {
    return Step::Continue;
  }

  if (!opened.ok()) {
    observability::record_connect_failed(opened.error().message);
    if (initial && options_.fail_fast_initial_connect) {
      outcome = RunResult::failure(opened.error());
      terminate("initial connection failed");
      return Step::Stop;
    }
    schedule_reconnect();
    return Step::Continue;
  }

  session_ = std::move(opened.value());
  offline_at_.reset();
  observability::record_session_connected(cursor_.stream_id, cursor_.page_token);
  transition(SessionState::Connected);
  return Step::Continue;
}

ResilienceManager::Step ResilienceManager::consume(RunResult &outcome) {
  SessionEvent event = session_->next();

  // A batch that became ready together with a cancellation is dropped unprocessed.
  if (gate_.is_cancelled()) {
    return Step::Continue;
  }

  switch (event.kind) {
  case SessionEventKind::Batch: {
    const auto handled = handle_batch(*event.batch);
    if (!handled.ok()) {
      observability::record_error("manager", handled.error().to_string());
      outcome = RunResult::failure(handled.error());
      terminate("output failure");
      return Step::Stop;
    }
    return Step::Continue;
  }
  case SessionEventKind::EndOfStream:
    observability::record_stream_ended(offline_at_);
    break;
  case SessionEventKind::Interrupted:
    observability::record_transport_error("session interrupted without cancellation");
    break;
  case SessionEventKind::TransportError:
    observability::record_transport_error(event.error);
    break;
  }

  session_.reset();
  schedule_reconnect();
  return Step::Continue;
}

void ResilienceManager::wait_for_deadline() {
  if (reconnect_deadline_.has_value()) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *reconnect_deadline_ - std::chrono::steady_clock::now());
    if (remaining.count() > 0 && gate_.wait_for(remaining)) {
      return;
    }
  }
  if (gate_.is_cancelled()) {
    return;
  }

  ++reconnect_attempts_;
  observability::record_reconnect_attempt(reconnect_attempts_, cursor_.page_token);
  observability::record_metric(observability::ReconnectAttemptsMetric{reconnect_attempts_});
  reconnect_deadline_.reset();
  transition(SessionState::Disconnected);
}

common::Result<void, StreamError> ResilienceManager::handle_batch(const Batch &batch) {
  ++batches_received_;
  if (batch.offline_at.has_value()) {
    offline_at_ = batch.offline_at;
  }

  const bool persist = !batch.empty();
  if (persist) {
    const auto appended = sink_.append(batch);
    if (!appended.ok()) {
      return appended;
    }
    ++batches_persisted_;
    observability::record_metric(observability::BatchesPersistedMetric{batches_persisted_});
  }

  // Only now, with the batch durable, may the cursor move past it.
  cursor_.page_token = batch.page_token;
  observability::record_batch(batch.items.size(), batch.page_token, persist);
  return common::Result<void, StreamError>::success();
}

void ResilienceManager::schedule_reconnect() {
  reconnect_deadline_ = std::chrono::steady_clock::now() + options_.reconnect_wait;
  observability::record_reconnect_scheduled(options_.reconnect_wait, reconnect_attempts_ + 1);
  transition(SessionState::ReconnectPending);
}

void ResilienceManager::terminate(const std::string &reason) {
  session_.reset();
  reconnect_deadline_.reset();
  observability::record_shutdown(reason.empty() ? std::string("cancelled") : reason);
  transition(SessionState::Terminated);
}

void ResilienceManager::transition(const SessionState next) {
  state_ = next;
  if (listener_) {
    listener_(state_, cursor_);
  }
}

} // namespace chatfetch::stream
