/**
 * @file session.hpp
 * @brief RadarLink session state machine — one state struct, one pure step function.
 *
 * @details
 * ## Field Brief
 * The C2 side of the link has a short, fixed script: say hello (keep-alive),
 * listen to the radar report its status, ask it to go to STANDBY, then to
 * OPERATE, and keep acknowledging status along the way. Everything the
 * session knows lives in `SessionState`. Everything it can do is returned from
 * `step()` as a bounded `Actions` list. No I/O, no clocks, no globals: the
 * caller supplies the time in each event and sends what comes back.
 *
 * ---
 *
 * @par States
 * ```
 *  Disconnected ──Connected──► Connected ──status>=standby_threshold──► StandbyRequested
 *                                                                          │
 *                                              reported == standby_state   │
 *                                                                          ▼
 *  Operate ◄──reported == operate_state── OperateRequested ◄──status>=operate_threshold── Standby
 *
 *  any ──ChannelLost──► Disconnected (all counters cleared)
 * ```
 * The operate threshold also applies straight from `StandbyRequested`: an RC
 * that never reports STANDBY still gets asked to OPERATE.
 *
 * ---
 *
 * @par Rules
 * - `Connected(now)`: one KeepAlive immediately, then one per
 *   `keepalive_interval_ms` on `Tick` until `ChannelLost`.
 * - Every SystemStatus increments `status_count`, malformed ones included.
 *   Malformed ones carry no radar state.
 * - Every `ack_every`-th status emits an Acknowledge carrying that status's
 *   sequence number. This is independent of the transitions and keeps running
 *   in `Operate`.
 * - A reported radar state equal to `operate_state` moves any connected state
 *   to `Operate`. After that no SystemControl is ever emitted automatically.
 * - At most one SystemControl per received status.
 * - Target and sensor messages bump counters only.
 * - `TooShort` frames never transition.
 * - Events other than `Connected` are ignored while `Disconnected`.
 * - `passive`: listen only. Counting and reported-state transitions still
 *   happen; nothing is ever emitted and no standby/operate is requested.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * radarlink::SessionConfig cfg;
 * radarlink::SessionState  st;
 * auto acts = radarlink::step(st, cfg, radarlink::Event::connected(now_ms));
 * for (const auto& body : acts.outbound) send(body);   // KeepAlive
 * @endcode
 */
#ifndef RADARLINK_SESSION_HPP
#define RADARLINK_SESSION_HPP

#include <stdint.h>
#include <optional>
#include "etl/string.h"
#include "etl/vector.h"
#include "radarlink/message.hpp"

namespace radarlink {

enum class LinkState : uint8_t {
  Disconnected = 0,
  Connected,
  StandbyRequested,
  Standby,
  OperateRequested,
  Operate,
};

/// "disconnected", "connected", "standby_requested", ...
const char* to_string(LinkState s);

/**
 * @struct SessionConfig
 * @brief Thresholds, cadences and the SystemControl template.
 *
 * `control_template` supplies mission category, sensor enables and frequency
 * index for every SystemControl the session emits; only `radar_state` is
 * overwritten.
 */
struct SessionConfig {
  uint32_t keepalive_interval_ms{1000};
  uint32_t standby_threshold{2};
  uint32_t operate_threshold{6};
  uint32_t ack_every{3};                   ///< 0 disables acknowledgements
  uint32_t standby_state{radar_state::STANDBY};
  uint32_t operate_state{radar_state::OPERATE};
  SystemControl control_template;
  bool passive{false};                     ///< listen only: never emit
};

/// The only mutable state of a link.
struct SessionState {
  LinkState state{LinkState::Disconnected};
  uint32_t status_count{0};
  uint32_t malformed_status_count{0};
  uint32_t target_count{0};        ///< TargetReport / SingleTarget* messages
  uint32_t sensor_count{0};        ///< SensorPosition / SystemMotion messages
  uint32_t other_count{0};
  uint32_t keepalives_sent{0};
  uint32_t acks_sent{0};
  uint32_t controls_sent{0};
  uint64_t next_keepalive_ms{0};
  std::optional<uint32_t> last_reported_state;
};

/// Input to `step()`. `message` is borrowed for the duration of the call.
struct Event {
  enum class Type : uint8_t { Connected, ChannelLost, Received, Tick };

  Type type{Type::Tick};
  uint64_t now_ms{0};
  const DecodedMessage* message{nullptr};

  static Event connected(uint64_t now) { return Event{Type::Connected, now, nullptr}; }
  static Event channel_lost()          { return Event{Type::ChannelLost, 0, nullptr}; }
  static Event tick(uint64_t now)      { return Event{Type::Tick, now, nullptr}; }
  static Event received(const DecodedMessage& m, uint64_t now = 0) {
    return Event{Type::Received, now, &m};
  }
};

/// Worst case per step: one Acknowledge + one SystemControl.
static constexpr size_t MAX_STEP_OUTBOUND = 4;
static constexpr size_t MAX_STEP_NOTES    = 4;

using NoteStr = etl::string<64>;

/**
 * @struct Actions
 * @brief What one `step()` wants done: messages to send and `key=value` notes to log.
 *
 * Outbound bodies are unsequenced; the channel stamps headers when it encodes.
 */
struct Actions {
  etl::vector<Body, MAX_STEP_OUTBOUND> outbound;
  etl::vector<NoteStr, MAX_STEP_NOTES> notes;
  bool transitioned{false};
  LinkState from{LinkState::Disconnected};
  LinkState to{LinkState::Disconnected};
};

/**
 * @brief Advance the session by one event.
 * @param st   State to update in place.
 * @param cfg  Thresholds and control template.
 * @param ev   The event.
 * @return Outbound messages and notes. Never throws.
 */
Actions step(SessionState& st, const SessionConfig& cfg, const Event& ev);

} // namespace radarlink

#endif // RADARLINK_SESSION_HPP
