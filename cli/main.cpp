/**
 * @file main.cpp
 * @brief radarlink-cli — Linux runner around radarlink::Channel, the codec, and a simulated RC.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and overlay them onto a JSON LinkConfig (nlohmann::json).
 *  - `run`    : connect to the RC over TCP, drive a Channel (keep-alive, standby,
 *               operate, acks), print decoded traffic and session transitions.
 *  - `monitor`: like `run` but listen only (passive session, nothing sent);
 *               prints an `event=stats` line every --stats-interval seconds.
 *  - `decode` : decode one hex frame from the command line and print it.
 *  - `sim`    : listen as a simulated RC: answer with SystemStatus at 1 Hz
 *               reflecting the last commanded radar state, and stream target
 *               and sensor reports every 2 s.
 *  - `--dump-config` prints the effective configuration as JSON and exits.
 *
 * Notes:
 *  - Errors are single lines on stderr: `status=error reason=<token> ...`.
 *  - Traffic and events are single `key=value` lines on stdout so the output
 *    greps well. ANSI emphasis only when stdout is a TTY and --no-color is off.
 *  - Exit codes: 0 ok, 1 I/O failure, 2 bad usage/config, 3 decode failure.
 */

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <chrono>
#include <iostream>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "radarlink/channel.hpp"
#include "radarlink/codec.hpp"
#include "radarlink/framer.hpp"
#include "radarlink/link_config.hpp"
#include "radarlink/pretty.hpp"
#include "tcp_io.hpp"

using json = nlohmann::json;
using namespace radarlink;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_stop = 0;
static void on_signal(int) { g_stop = 1; }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

static void print_decoded(const DecodedMessage& dm, const std::string& format, const Ansi& ansi) {
  if (format == "json") {
    std::cout << to_json(dm).dump() << "\n";
  } else if (format == "pretty") {
    std::cout << ansi.bold("IN  ") << describe(dm);
  } else {
    std::cout << "dir=in " << decode_pretty(dm) << "\n";
  }
}

// ---------- run / monitor: C2 side ----------

static void print_stats(const Channel& ch) {
  const SessionState& st = ch.session();
  std::cout << "event=stats state=" << to_string(ch.state())
            << " frames_in=" << ch.frames_received()
            << " frames_out=" << ch.frames_sent()
            << " statuses=" << st.status_count
            << " malformed=" << st.malformed_status_count
            << " targets=" << st.target_count
            << " sensors=" << st.sensor_count
            << " other=" << st.other_count
            << " desyncs=" << ch.desync_count() << "\n";
}

// -----------------------------------------------------------------------------
// run_link() — One connection, one Channel, one thread.
// POLICY:
//   - read_some() waits at most 100 ms, so the keep-alive timer in tick()
//     keeps its 1 s cadence while the RC is quiet.
//   - Any socket error or a full receive buffer ends the session; no reconnect.
//   - stats_interval_s > 0 prints an event=stats line at that period.
// -----------------------------------------------------------------------------
static int run_link(const LinkConfig& cfg, int duration_s, int connect_timeout_ms,
                    int stats_interval_s, const std::string& format, const Ansi& ansi) {
  int fd = open_tcp_client(cfg.host, cfg.port, connect_timeout_ms);
  if (fd < 0) {
    std::cerr << ansi.red("status=error reason=connect_failed") << " host=" << cfg.host
              << " port=" << cfg.port << "\n";
    return 1;
  }
  std::cout << "event=connected host=" << cfg.host << " port=" << cfg.port
            << " passive=" << (cfg.channel.session.passive ? 1 : 0) << "\n";

  Channel ch(cfg.channel);
  const uint64_t t0 = now_ms_steady();
  ch.connect(t0);
  const uint64_t stats_every_ms = static_cast<uint64_t>(stats_interval_s) * 1000;
  uint64_t next_stats = t0 + stats_every_ms;

  int rc = 0;
  const char* end_reason = "stopped";
  std::vector<uint8_t> buf(8192);
  std::vector<uint8_t> frame;
  DecodedMessage dm;
  NoteStr note;

  while (!g_stop) {
    const uint64_t now = now_ms_steady();
    if (duration_s > 0 && now - t0 >= static_cast<uint64_t>(duration_s) * 1000) {
      end_reason = "duration_elapsed";
      break;
    }

    size_t n = 0;
    const ReadResult r = read_some(fd, buf.data(), buf.size(), 100, n);
    if (r == ReadResult::Closed || r == ReadResult::Error) {
      end_reason = to_string(r);
      rc = (r == ReadResult::Error) ? 1 : 0;
      break;
    }
    if (r == ReadResult::Data && !ch.add_bytes(buf.data(), n)) {
      std::cerr << "status=error reason=receive_buffer_full\n";
      end_reason = "receive_buffer_full";
      rc = 1;
      break;
    }

    while (ch.tick(now_ms_steady())) {}

    bool write_failed = false;
    while (ch.get_message(frame)) {
      if (!write_all(fd, frame.data(), frame.size())) { write_failed = true; break; }
      const DecodedMessage sent = decode_message(frame, cfg.channel.codec);
      if (format == "kv") std::cout << "dir=out " << decode_pretty(sent) << "\n";
      else if (format == "json") std::cout << to_json(sent).dump() << "\n";
      else std::cout << ansi.bold("OUT ") << describe(sent);
    }
    while (ch.get_note(note)) std::cout << note.c_str() << " state=" << to_string(ch.state()) << "\n";
    while (ch.get_decoded(dm)) print_decoded(dm, format, ansi);

    if (stats_every_ms && now_ms_steady() >= next_stats) {
      print_stats(ch);
      next_stats += stats_every_ms;
    }

    if (write_failed) {
      std::cerr << "status=error reason=write_failed\n";
      end_reason = "write_failed";
      rc = 1;
      break;
    }
  }

  print_stats(ch);   // before disconnect() zeroes the session counters
  ch.disconnect();
  while (ch.get_note(note)) std::cout << note.c_str() << "\n";
  close_socket(fd);

  std::cout << "event=session_end reason=" << end_reason
            << " dropped_out=" << ch.dropped_outbound() << "\n";
  return rc;
}

// ---------- sim: RC side ----------

struct SimState {
  uint32_t radar_state{0};
  uint32_t seq{1};
  uint32_t target_seed{1};
};

static bool sim_send(int fd, const LinkConfig& cfg, SimState& sim, const Body& body) {
  MessageHeader h;
  h.source_id       = cfg.channel.source_id;
  h.time_tag        = ms_since_midnight();
  h.sequence_number = sim.seq;
  sim.seq = (sim.seq == 0xFFFFFFFFu) ? 1 : sim.seq + 1;
  const std::vector<uint8_t> f = encode_message(h, body, cfg.channel.codec);
  return write_all(fd, f.data(), f.size());
}

static SystemStatus sim_status(const SimState& sim) {
  SystemStatus s;
  s.radar_state           = sim.radar_state;
  s.operating_mode        = 1;
  s.error_code            = 0;
  s.temperature_dc        = 235;
  s.power_status          = power::MAIN | power::TRANSMITTER | power::RECEIVER |
                            power::ANTENNA_DRIVE | power::PROCESSING_UNIT;
  s.antenna_position_cdeg = 0;
  return s;
}

static TargetReport sim_targets(SimState& sim) {
  TargetReport r;
  for (uint32_t i = 0; i < 2; ++i) {
    Target t;
    t.id             = sim.target_seed + i;
    t.range_mm       = 1500000 + 25000 * ((sim.target_seed + i) % 40);
    t.azimuth_mdeg   = (45000 + 3000 * sim.target_seed + 90000 * i) % 360000;
    t.elevation_mdeg = 2500;
    t.velocity_cms   = -1200;
    t.rcs_cdbsm      = 350;
    t.classification = static_cast<int32_t>(TargetClass::Aircraft);
    t.confidence     = 90;
    r.targets.push_back(t);
  }
  r.declared_count = static_cast<uint32_t>(r.targets.size());
  ++sim.target_seed;
  return r;
}

// -----------------------------------------------------------------------------
// run_sim() — Serve one C2 connection at a time until stopped.
// POLICY:
//   - The simulated radar adopts any commanded radar_state at once.
//   - Status every 1000 ms; TargetReport and SensorPosition every 2000 ms.
// -----------------------------------------------------------------------------
static int run_sim(const LinkConfig& cfg, const std::string& format, const Ansi& ansi) {
  int lfd = open_tcp_server(cfg.host, cfg.port);
  if (lfd < 0) {
    std::cerr << ansi.red("status=error reason=listen_failed") << " host=" << cfg.host
              << " port=" << cfg.port << "\n";
    return 1;
  }
  std::cout << "event=listening host=" << cfg.host << " port=" << cfg.port << "\n";

  std::vector<uint8_t> buf(8192);
  std::vector<uint8_t> frame;

  while (!g_stop) {
    int fd = accept_client(lfd, 500);
    if (fd < 0) continue;
    std::cout << "event=client_connected\n";

    SimState sim;
    StreamFramer framer(cfg.channel.codec.header, cfg.channel.max_message);
    uint64_t next_status = now_ms_steady() + 1000;
    uint64_t next_report = now_ms_steady() + 2000;
    const char* end_reason = "stopped";

    while (!g_stop) {
      size_t n = 0;
      const ReadResult r = read_some(fd, buf.data(), buf.size(), 100, n);
      if (r == ReadResult::Closed || r == ReadResult::Error) { end_reason = to_string(r); break; }
      if (r == ReadResult::Data) framer.feed(buf.data(), n);

      while (framer.next(frame)) {
        const DecodedMessage dm = decode_message(frame, cfg.channel.codec);
        print_decoded(dm, format, ansi);
        if (const SystemControl* c = std::get_if<SystemControl>(&dm.body)) {
          sim.radar_state = c->radar_state;
          std::cout << "event=radar_state_set state=" << sim.radar_state << "\n";
        }
      }

      const uint64_t now = now_ms_steady();
      bool ok = true;
      if (now >= next_status) {
        ok = sim_send(fd, cfg, sim, sim_status(sim));
        next_status = now + 1000;
      }
      if (ok && now >= next_report) {
        ok = sim_send(fd, cfg, sim, sim_targets(sim));
        SensorPosition p;
        p.latitude_e7  = 515074000;
        p.longitude_e7 = -1278000;
        p.altitude_mm  = 35000;
        p.heading_mdeg = 90000;
        if (ok) ok = sim_send(fd, cfg, sim, p);
        next_report = now + 2000;
      }
      if (!ok) { end_reason = "write_failed"; break; }
    }

    close_socket(fd);
    std::cout << "event=client_disconnected reason=" << end_reason
              << " desyncs=" << framer.desync_count() << "\n";
  }

  close_socket(lfd);
  return 0;
}

// ---------- decode ----------

static int run_decode(const LinkConfig& cfg, const std::string& hex, const std::string& format,
                      bool list, const Ansi& ansi) {
  if (list) {
    for (const CatalogEntry* e = catalog_begin(); e != catalog_end(); ++e) {
      char id[11];
      std::snprintf(id, sizeof(id), "0x%08x", static_cast<unsigned>(e->id));
      std::cout << "id=" << id << " kind=" << to_string(e->kind) << " name=\"" << e->name << "\"\n";
    }
    return 0;
  }

  std::vector<uint8_t> bytes;
  if (!parse_hex(hex, bytes)) {
    std::cerr << ansi.red("status=error reason=bad_hex") << "\n";
    return 2;
  }

  const DecodedMessage dm = decode_message(bytes, cfg.channel.codec);
  if (format == "json")        std::cout << to_json(dm).dump(2) << "\n";
  else if (format == "pretty") std::cout << describe(dm);
  else                         std::cout << decode_pretty(dm) << "\n";

  if (dm.status == DecodeStatus::TooShort) return 2;
  return dm.ok() ? 0 : 3;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  std::string opt_config;
  bool opt_dump_config = false;
  bool opt_no_color = false;
  std::string opt_format = "kv";            // kv|pretty|json
  std::string opt_header_rev;
  std::string opt_control_rev;
  std::string opt_host;
  int opt_port = -1;
  long long opt_source_id = -1;

  // run
  int opt_duration_s = 0;
  int opt_connect_timeout_ms = 3000;
  int opt_stats_interval_s = 30;

  // decode
  std::string opt_hex;
  bool opt_list = false;

  CLI::App app{"RadarLink C2 <-> RC link tool"};
  app.require_subcommand(0, 1);
  app.fallthrough();              // global options may follow the subcommand

  app.add_option("--config", opt_config, "JSON link configuration file");
  app.add_flag("--dump-config", opt_dump_config, "Print the effective configuration as JSON and exit");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--format", opt_format, "Output format: kv|pretty|json")
      ->check(CLI::IsMember({"kv", "pretty", "json"}))->capture_default_str();
  app.add_option("--header-revision", opt_header_rev, "Header field order: icd-2135m-004|message-first")
      ->check(CLI::IsMember({"icd-2135m-004", "message-first"}));
  app.add_option("--control-revision", opt_control_rev, "SystemControl layout: icd-40|extended-44")
      ->check(CLI::IsMember({"icd-40", "extended-44"}));
  app.add_option("--host", opt_host, "RC host (run) or bind address (sim)");
  app.add_option("--port", opt_port, "RC TCP port")->check(CLI::Range(1, 65535));
  app.add_option("--source-id", opt_source_id, "Our source_id on the wire")
      ->check(CLI::Range(0LL, 4294967295LL));

  CLI::App* run = app.add_subcommand("run", "Connect to the RC and drive the session");
  run->add_option("--duration", opt_duration_s, "Stop after N seconds (0 = until Ctrl-C)")
      ->check(CLI::NonNegativeNumber);
  run->add_option("--connect-timeout", opt_connect_timeout_ms, "Connect timeout (ms)")
      ->check(CLI::PositiveNumber);

  CLI::App* mon = app.add_subcommand("monitor", "Connect to the RC and listen only; never send");
  mon->add_option("--duration", opt_duration_s, "Stop after N seconds (0 = until Ctrl-C)")
      ->check(CLI::NonNegativeNumber);
  mon->add_option("--connect-timeout", opt_connect_timeout_ms, "Connect timeout (ms)")
      ->check(CLI::PositiveNumber);
  mon->add_option("--stats-interval", opt_stats_interval_s, "Seconds between event=stats lines (0 = off)")
      ->check(CLI::NonNegativeNumber)->capture_default_str();

  CLI::App* dec = app.add_subcommand("decode", "Decode one hex-encoded frame");
  dec->add_option("hex", opt_hex, "Frame bytes as hex (spaces/colons allowed)");
  dec->add_flag("--list", opt_list, "List the message catalog instead");

  CLI::App* sim = app.add_subcommand("sim", "Act as a simulated RC");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format != "json";

  // Effective config: defaults <- file <- command line
  LinkConfig cfg;
  std::string reason;
  if (!opt_config.empty() && !load_link_config(opt_config, cfg, reason)) {
    std::cerr << ansi.red("status=error reason=" + reason) << " file=" << opt_config << "\n";
    return 2;
  }
  {
    json overrides = json::object();
    if (!opt_header_rev.empty())  overrides["header_revision"]  = opt_header_rev;
    if (!opt_control_rev.empty()) overrides["control_revision"] = opt_control_rev;
    if (!opt_host.empty())        overrides["host"]             = opt_host;
    if (opt_port > 0)             overrides["port"]             = opt_port;
    if (opt_source_id >= 0)       overrides["source_id"]        = opt_source_id;
    if (!apply_link_config(overrides, cfg, reason)) {
      std::cerr << ansi.red("status=error reason=" + reason) << "\n";
      return 2;
    }
  }

  if (opt_dump_config) {
    std::cout << link_config_to_json(cfg).dump(2) << "\n";
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (*run) return run_link(cfg, opt_duration_s, opt_connect_timeout_ms, 0, opt_format, ansi);
  if (*mon) {
    cfg.channel.session.passive = true;
    return run_link(cfg, opt_duration_s, opt_connect_timeout_ms, opt_stats_interval_s,
                    opt_format, ansi);
  }
  if (*sim) return run_sim(cfg, opt_format, ansi);
  if (*dec) {
    if (!opt_list && opt_hex.empty()) {
      std::cerr << "status=error reason=need_hex_or_list\n";
      return 2;
    }
    return run_decode(cfg, opt_hex, opt_format, opt_list, ansi);
  }

  std::cerr << "status=error reason=need_subcommand\n";
  std::cerr << app.help();
  return 2;
}
