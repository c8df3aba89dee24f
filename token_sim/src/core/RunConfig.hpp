#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <optional>

namespace tokensim {

    /// Execution settings for a batch of scenarios. Every field has a default
    /// so an empty "run" block is valid; the driver's command line patches
    /// individual fields on top of the file.

    struct RunConfig {

        // ---- Monte-Carlo shape ---------------------------------------------------
        int iterations = 36;
        int repetitions = 30;
        std::optional<uint64_t> seed;   // fresh entropy when absent
        size_t threads = 1;             // 0 = hardware concurrency

        // ---- Logging -------------------------------------------------------------
        struct LoggingParams {
            std::string file = "token_sim.log";
            std::string level = "info";
            bool console = true;
        } logging;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["iterations"] = iterations;
            j["repetitions"] = repetitions;
            j["threads"] = threads;
            if (seed) {
                j["seed"] = *seed;
            }

            j["logging"] = {
                {"file",    logging.file},
                {"level",   logging.level},
                {"console", logging.console}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            get(j, "iterations", iterations);
            get(j, "repetitions", repetitions);
            get(j, "threads", threads);

            if (j.contains("seed")) {
                if (j["seed"].is_null()) {
                    seed.reset();
                } else {
                    seed = j["seed"].get<uint64_t>();
                }
            }

            if (j.contains("logging")) {
                auto& l = j["logging"];
                get(l, "file", logging.file);
                get(l, "level", logging.level);
                get(l, "console", logging.console);
            }
        }
    };

} // namespace tokensim
