#include "unified_ring/io/ring_io.hpp"

#include <format>
#include <fstream>
#include <log.h>
#include <optional>
#include <sstream>
#include <utility>

#include "unified_ring/core/parse.hpp"

namespace unified_ring {

    namespace {

        // Handler returns nullopt when the key was consumed or unknown, an error otherwise.
        template<typename Handler>
        ring_expected_void parse_fields(const std::string_view text, const std::string_view what, Handler handler) {
            std::optional<ring_error> failure;
            bool                      version_found = false;

            parse::for_each_line(text, [&](const size_t number, const std::string_view raw) {
                if (failure) return;
                const std::string_view line = parse::trim(raw);
                if (line.empty() || line.front() == '#') return;

                const auto kv = parse::split_key_value(line);
                if (!kv) {
                    failure = ring_error{ring_error_code::file_malformed,
                                         std::format("line {}: expected key=value", number)};
                    return;
                }
                const auto [key, value] = *kv;

                if (key == "version") {
                    version_found = true;
                    if (const int v = parse::parse_int(value, -1); v != ring_file_version) {
                        Log::warning("RingIO", what, " version ", v, " differs from expected ", ring_file_version);
                    }
                    return;
                }
                if (auto err = handler(key, value)) {
                    err->detail = std::format("line {}: {}", number, err->detail);
                    failure     = std::move(err);
                }
            });

            if (failure) return std::unexpected{std::move(*failure)};
            if (!version_found) {
                Log::warning("RingIO", "no version line in ", what, "; assuming version ", ring_file_version);
            }
            return {};
        }

        [[nodiscard]] ring_error bad_value(const std::string_view key, const std::string_view value) {
            return ring_error{ring_error_code::file_malformed, std::format("bad value '{}' for {}", value, key)};
        }

        ring_expected_void write_text(const std::filesystem::path &path, const std::string &text) {
            std::ofstream file(path);
            if (!file.is_open()) {
                Log::error("RingIO", "save failed: could not open ", path.c_str());
                return make_ring_error(ring_error_code::file_open_failed, path.string());
            }
            file << text;
            file.flush();
            if (!file) {
                Log::error("RingIO", "save failed: write error on ", path.c_str());
                return make_ring_error(ring_error_code::file_write_failed, path.string());
            }
            Log::info("RingIO", "saved ", path.c_str());
            return {};
        }

        ring_expected<std::string> read_text(const std::filesystem::path &path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                Log::error("RingIO", "load failed: could not open ", path.c_str());
                return make_ring_error(ring_error_code::file_open_failed, path.string());
            }
            std::ostringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

    } // namespace

    // ============================================================================
    // ring_config
    // ============================================================================

    std::string format_config(const ring_config &cfg) {
        return std::format("version={}\nduration_ms={}\nsmall_arc_threshold={}\nthreshold_inclusive={}\n",
                           ring_file_version, cfg.duration_ms, cfg.small_arc_threshold, cfg.threshold_inclusive);
    }

    ring_expected<ring_config> parse_config(const std::string_view text) {
        ring_config cfg;
        const auto  field = [&](const std::string_view key, const std::string_view value) -> std::optional<ring_error> {
            if (key == "duration_ms") {
                const auto ms = parse::try_parse_int(value);
                if (!ms) return bad_value(key, value);
                if (*ms <= 0) {
                    return ring_error{ring_error_code::value_out_of_range,
                                      std::format("duration_ms must be positive, got {}", *ms)};
                }
                cfg.duration_ms = *ms;
            } else if (key == "small_arc_threshold") {
                const auto t = parse::try_parse_float(value);
                if (!t) return bad_value(key, value);
                if (*t < 0.0f || *t > 1.0f) {
                    return ring_error{ring_error_code::value_out_of_range,
                                      std::format("small_arc_threshold must be in [0, 1], got {}", *t)};
                }
                cfg.small_arc_threshold = *t;
            } else if (key == "threshold_inclusive") {
                const auto b = parse::try_parse_bool(value);
                if (!b) return bad_value(key, value);
                cfg.threshold_inclusive = *b;
            }
            return std::nullopt;
        };

        if (auto parsed = parse_fields(text, "config", field); !parsed) return std::unexpected{std::move(parsed.error())};
        return cfg;
    }

    ring_expected_void save_config_file(const std::filesystem::path &path, const ring_config &cfg) {
        return write_text(path, format_config(cfg));
    }

    ring_expected<ring_config> load_config_file(const std::filesystem::path &path) {
        return read_text(path).and_then([&](const std::string &text) {
            auto cfg = parse_config(text);
            if (!cfg) Log::error("RingIO", "load failed: ", path.c_str(), ": ", cfg.error().message());
            return cfg;
        });
    }

    // ============================================================================
    // ring_saved_state
    // ============================================================================

    std::string format_saved_state(const ring_saved_state &state) {
        return std::format("version={}\nprogress={}\nindeterminate={}\n", ring_file_version, state.progress,
                           state.indeterminate);
    }

    ring_expected<ring_saved_state> parse_saved_state(const std::string_view text) {
        ring_saved_state state;
        const auto       field = [&](const std::string_view key, const std::string_view value) -> std::optional<ring_error> {
            if (key == "progress") {
                const auto p = parse::try_parse_int(value);
                if (!p) return bad_value(key, value);
                state.progress = *p;
            } else if (key == "indeterminate") {
                const auto b = parse::try_parse_bool(value);
                if (!b) return bad_value(key, value);
                state.indeterminate = *b;
            }
            return std::nullopt;
        };

        if (auto parsed = parse_fields(text, "state", field); !parsed) return std::unexpected{std::move(parsed.error())};
        return state;
    }

    ring_expected_void save_saved_state_file(const std::filesystem::path &path, const ring_saved_state &state) {
        return write_text(path, format_saved_state(state));
    }

    ring_expected<ring_saved_state> load_saved_state_file(const std::filesystem::path &path) {
        return read_text(path).and_then([&](const std::string &text) {
            auto state = parse_saved_state(text);
            if (!state) Log::error("RingIO", "load failed: ", path.c_str(), ": ", state.error().message());
            return state;
        });
    }

} // namespace unified_ring
