#include "config.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "memory/fact_store.hpp"
#include "knowledge/document_index.hpp"
#include "prompt.hpp"
#include "seed_loader.hpp"
#include "turn_ledger.hpp"
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: lunacore COMMAND [args] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  seed CSV [--reset] [--keep N]   Load pinned facts from a key,value CSV\n"
              << "  reset                           Delete all memories, turns, sessions and documents\n"
              << "  memories                        List pinned and recent memories\n"
              << "  context                         Print the pinned context block\n"
              << "  remember KEY VALUE [--pin] [--score S]\n"
              << "                                  Store a fact (non-pinned unless --pin)\n"
              << "  forget KEY                      Remove pinned and non-pinned facts for KEY\n"
              << "  ingest FILE [--source L] [--title T]\n"
              << "                                  Chunk and store a text document\n"
              << "  documents                       List ingested documents\n"
              << "  query TEXT [-k N] [--min-score S]\n"
              << "                                  Rebuild the index and retrieve chunks\n"
              << "  history SESSION [--limit N]     Show the turns of a session\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                      Show this help\n"
              << "\n"
              << "Configuration: ~/.lunacore/config.json\n"
              << "Environment variables:\n"
              << "  LUNACORE_DB_PATH              Storage location\n"
              << "  LUNACORE_PINNED_CACHE_TTL     Pinned-read cache TTL (seconds)\n"
              << "  LUNACORE_NON_PINNED_CAP       Max non-pinned memories\n"
              << "  LUNACORE_CHUNK_CHARS          Chunk size bound (characters)\n"
              << "  LUNACORE_RETRIEVE_K           Retrieval result count\n"
              << "  LUNACORE_MIN_SCORE            Minimum retrieval score\n";
}

struct Args {
    std::string command;
    std::vector<std::string> positional;
    bool reset = false;
    bool pin = false;
    long keep = -1;
    long k = -1;
    long limit = -1;
    double score = 1.0;
    double min_score = -1.0;
    std::string source;
    std::string title;
};

static bool parse_args(int argc, char* argv[], Args& args) {
    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--reset") == 0) {
                args.reset = true;
            } else if (std::strcmp(argv[i], "--pin") == 0) {
                args.pin = true;
            } else if (std::strcmp(argv[i], "--keep") == 0 && i + 1 < argc) {
                args.keep = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
                args.k = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
                args.limit = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--score") == 0 && i + 1 < argc) {
                args.score = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--min-score") == 0 && i + 1 < argc) {
                args.min_score = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--source") == 0 && i + 1 < argc) {
                args.source = argv[++i];
            } else if (std::strcmp(argv[i], "--title") == 0 && i + 1 < argc) {
                args.title = argv[++i];
            } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                return false;
            } else if (args.command.empty()) {
                args.command = argv[i];
            } else {
                args.positional.emplace_back(argv[i]);
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid numeric option value\n";
        return false;
    }
    if (args.keep == 0 || args.keep < -1 || args.k < -1 || args.limit < -1) {
        std::cerr << "Numeric options must be positive\n";
        return false;
    }
    return true;
}

static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

static int run(const Args& args, lunacore::Config& config) {
    if (args.keep > 0) {
        config.memory.non_pinned_cap = static_cast<uint32_t>(args.keep);
    }
    config.validate();

    lunacore::Database db(config.db_path());
    lunacore::FactStore facts(db, config.memory);
    lunacore::TurnLedger ledger(db);
    lunacore::DocumentIndex documents(db, config.knowledge);

    const auto& cmd = args.command;
    const auto& pos = args.positional;

    if (cmd == "seed") {
        if (pos.size() != 1) {
            std::cerr << "Usage: lunacore seed CSV [--reset] [--keep N]\n";
            return 1;
        }
        if (args.reset) facts.delete_all();
        auto result = lunacore::load_seed_csv(facts, pos[0], config.memory.seed_score);
        std::cout << "Loaded/updated pinned memories: " << result.loaded << "\n"
                  << "Pruned non-pinned to latest: " << facts.non_pinned_cap()
                  << " (deleted " << result.pruned << ")\n";
        return 0;
    }

    if (cmd == "reset") {
        facts.delete_all();
        documents.delete_all();
        db.vacuum();
        std::cout << "All memories, turns, sessions and documents deleted.\n";
        return 0;
    }

    if (cmd == "memories") {
        std::cout << lunacore::format_memory_listing(facts.get_pinned(), facts.get_all(30)) << "\n";
        return 0;
    }

    if (cmd == "context") {
        std::cout << lunacore::load_pinned_context(facts, config.memory.pinned_limit) << "\n";
        return 0;
    }

    if (cmd == "remember") {
        if (pos.size() < 2) {
            std::cerr << "Usage: lunacore remember KEY VALUE [--pin] [--score S]\n";
            return 1;
        }
        std::string value = join(std::vector<std::string>(pos.begin() + 1, pos.end()));
        if (args.pin) {
            facts.upsert(pos[0], value, args.score, true);
        } else {
            facts.add_non_pinned(pos[0], value, args.score);
        }
        std::cout << "Stored " << (args.pin ? "pinned" : "non-pinned") << " memory: "
                  << pos[0] << "\n";
        return 0;
    }

    if (cmd == "forget") {
        if (pos.size() != 1) {
            std::cerr << "Usage: lunacore forget KEY\n";
            return 1;
        }
        std::cout << "Removed " << facts.forget(pos[0]) << " memory row(s)\n";
        return 0;
    }

    if (cmd == "ingest") {
        if (pos.size() != 1) {
            std::cerr << "Usage: lunacore ingest FILE [--source L] [--title T]\n";
            return 1;
        }
        std::string id = documents.ingest_file(pos[0], args.source, args.title);
        std::cout << "Ingested document " << id << "\n";
        return 0;
    }

    if (cmd == "documents") {
        auto docs = documents.list_documents();
        if (docs.empty()) {
            std::cout << "No documents ingested.\n";
            return 0;
        }
        for (const auto& d : docs) {
            std::cout << d.id << "  " << d.source << "  (" << d.chunk_count << " chunks)";
            if (!d.title.empty()) std::cout << "  " << d.title;
            std::cout << "\n";
        }
        return 0;
    }

    if (cmd == "query") {
        std::string query = join(pos);
        if (query.empty()) {
            std::cerr << "Usage: lunacore query TEXT [-k N] [--min-score S]\n";
            return 1;
        }
        documents.rebuild_index();
        uint32_t k = args.k > 0 ? static_cast<uint32_t>(args.k) : config.knowledge.retrieve_k;
        double min_score = args.min_score >= 0.0 ? args.min_score : config.knowledge.min_score;
        auto results = documents.retrieve(query, k, min_score);
        if (results.empty()) {
            std::cout << "No matching chunks.\n";
            return 0;
        }
        for (const auto& r : results) {
            std::cout << "[" << std::fixed << std::setprecision(3) << r.score << "] "
                      << r.source << " #" << r.sequence_no << "\n"
                      << r.text << "\n\n";
        }
        return 0;
    }

    if (cmd == "history") {
        if (pos.size() != 1) {
            std::cerr << "Usage: lunacore history SESSION [--limit N]\n";
            return 1;
        }
        auto turns = args.limit > 0
            ? ledger.get_recent_turns(pos[0], static_cast<uint32_t>(args.limit))
            : ledger.get_session_turns(pos[0]);
        for (const auto& t : turns) {
            std::cout << t.role << ": " << t.text
                      << "  (asr " << t.latencies.asr_ms << "ms, llm " << t.latencies.llm_ms
                      << "ms, tts " << t.latencies.tts_ms << "ms)\n";
        }
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
    }

    Args args;
    if (!parse_args(argc, argv, args) || args.command.empty()) {
        print_usage();
        return 1;
    }

    auto config = lunacore::Config::load();
    return run(args, config);
} catch (const lunacore::InvalidInput& e) {
    std::cerr << "Invalid input: " << e.what() << '\n';
    return 2;
} catch (const lunacore::ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << '\n';
    return 3;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
