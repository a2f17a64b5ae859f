// -----------------------------------------------------------------------------
// session.cpp — Implementation of the RadarLink session state machine
//
// API, state diagram & rules:
//   see include/radarlink/session.hpp
//
// Runnable scenario tests:
//   see tests/test_session.cpp
//
// NOTE: step() is the single writer of SessionState. Helpers below take the
// state and the Actions being built by reference and never touch anything else.
// -----------------------------------------------------------------------------
#include "radarlink/session.hpp"

#include <cstdio>

namespace radarlink {

const char* to_string(LinkState s) {
  switch (s) {
    case LinkState::Disconnected:     return "disconnected";
    case LinkState::Connected:        return "connected";
    case LinkState::StandbyRequested: return "standby_requested";
    case LinkState::Standby:          return "standby";
    case LinkState::OperateRequested: return "operate_requested";
    case LinkState::Operate:          return "operate";
  }
  return "unknown";
}

namespace {

void note(Actions& a, const char* text) {
  if (!a.notes.full()) a.notes.push_back(NoteStr(text));
}

void emit(Actions& a, const Body& body) {
  if (!a.outbound.full()) a.outbound.push_back(body);
}

void transition(SessionState& st, Actions& a, LinkState to) {
  if (!a.transitioned) a.from = st.state;
  a.transitioned = true;
  a.to = to;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "event=transition from=%s to=%s",
                to_string(st.state), to_string(to));
  st.state = to;
  note(a, buf);
}

void emit_keepalive(SessionState& st, const SessionConfig& cfg, Actions& a, uint64_t now) {
  if (cfg.passive) return;
  emit(a, KeepAlive{});
  ++st.keepalives_sent;
  st.next_keepalive_ms = now + cfg.keepalive_interval_ms;
}

void emit_control(SessionState& st, const SessionConfig& cfg, Actions& a, uint32_t radar_state) {
  SystemControl c = cfg.control_template;
  c.radar_state = radar_state;
  emit(a, c);
  ++st.controls_sent;
}

bool is_connected(LinkState s) { return s != LinkState::Disconnected; }

// -----------------------------------------------------------------------------
// on_status() — Count, acknowledge, then at most one transition.
// PRE:   st.state is connected; dm.kind == SystemStatus.
// POLICY:
//   - Ack cadence runs first and independently of transitions.
//   - A reported OPERATE wins over any threshold.
//   - Thresholds use >=, so a late RC still gets asked once we are past them.
//   - Passive sessions count and follow reported state, never ask.
// -----------------------------------------------------------------------------
void on_status(SessionState& st, const SessionConfig& cfg, const DecodedMessage& dm, Actions& a) {
  ++st.status_count;

  std::optional<uint32_t> reported;
  const SystemStatus* status = dm.ok() ? std::get_if<SystemStatus>(&dm.body) : nullptr;
  if (status) {
    reported = status->radar_state;
    st.last_reported_state = reported;
  } else {
    ++st.malformed_status_count;
    note(a, "event=status_malformed");
  }

  if (!cfg.passive && cfg.ack_every && st.status_count % cfg.ack_every == 0) {
    emit(a, Acknowledge{ dm.header.sequence_number });
    ++st.acks_sent;
  }

  if (st.state == LinkState::Operate) return;

  if (reported && *reported == cfg.operate_state) {
    transition(st, a, LinkState::Operate);
    return;
  }
  if (reported && *reported == cfg.standby_state && st.state == LinkState::StandbyRequested) {
    transition(st, a, LinkState::Standby);
    return;
  }
  if (cfg.passive) return;

  if (st.state == LinkState::Connected && st.status_count >= cfg.standby_threshold) {
    transition(st, a, LinkState::StandbyRequested);
    emit_control(st, cfg, a, cfg.standby_state);
  } else if ((st.state == LinkState::StandbyRequested || st.state == LinkState::Standby) &&
             st.status_count >= cfg.operate_threshold) {
    transition(st, a, LinkState::OperateRequested);
    emit_control(st, cfg, a, cfg.operate_state);
  }
}

void on_received(SessionState& st, const SessionConfig& cfg, const DecodedMessage& dm, Actions& a) {
  if (dm.status == DecodeStatus::TooShort) {
    note(a, "event=decode_error reason=too_short");
    return;
  }

  switch (dm.kind) {
    case MessageKind::SystemStatus:
      on_status(st, cfg, dm, a);
      break;
    case MessageKind::TargetReport:
    case MessageKind::SingleTargetReport:
    case MessageKind::SingleTargetExtended:
      ++st.target_count;
      break;
    case MessageKind::SensorPosition:
    case MessageKind::SystemMotion:
      ++st.sensor_count;
      break;
    default:
      ++st.other_count;
      break;
  }
}

} // namespace

// -----------------------------------------------------------------------------
// step() — Route one event.
// POLICY:
//   - Connected always restarts the session, even if already connected.
//   - Tick emits at most one KeepAlive; a stalled caller does not get a burst.
// -----------------------------------------------------------------------------
Actions step(SessionState& st, const SessionConfig& cfg, const Event& ev) {
  Actions a;
  a.from = a.to = st.state;

  switch (ev.type) {
    case Event::Type::Connected:
      st = SessionState{};
      transition(st, a, LinkState::Connected);
      emit_keepalive(st, cfg, a, ev.now_ms);
      break;

    case Event::Type::ChannelLost:
      if (is_connected(st.state)) transition(st, a, LinkState::Disconnected);
      st = SessionState{};
      break;

    case Event::Type::Tick:
      if (!is_connected(st.state) || cfg.keepalive_interval_ms == 0) break;
      if (ev.now_ms >= st.next_keepalive_ms) emit_keepalive(st, cfg, a, ev.now_ms);
      break;

    case Event::Type::Received:
      if (!is_connected(st.state) || !ev.message) break;
      on_received(st, cfg, *ev.message, a);
      break;
  }
  return a;
}

} // namespace radarlink
