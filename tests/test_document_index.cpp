#include <catch2/catch.hpp>
#include "config.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "knowledge/document_index.hpp"
#include "util.hpp"
#include "temp_db.hpp"
#include <atomic>
#include <thread>

using namespace lunacore;

static KnowledgeConfig knowledge_config(size_t chunk_chars = 1200) {
    KnowledgeConfig cfg;
    cfg.chunk_chars = chunk_chars;
    cfg.retrieve_k = 5;
    cfg.min_score = 0.0;
    return cfg;
}

// ── Ingestion ────────────────────────────────────────────────

TEST_CASE("DocumentIndex: ingest stores document and chunks", "[document_index]") {
    TempDbFile file("doc_ingest");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    std::string text = std::string(750, 'a') + "\n\n" + std::string(750, 'b') + "\n\n" +
                       std::string(750, 'c') + "\n\n" + std::string(750, 'd');
    auto id = docs.ingest_text("manual.txt", text, "Manual");

    auto list = docs.list_documents();
    REQUIRE(list.size() == 1);
    REQUIRE(list[0].id == id);
    REQUIRE(list[0].source == "manual.txt");
    REQUIRE(list[0].title == "Manual");
    REQUIRE(list[0].chunk_count == 4);
    REQUIRE(list[0].created_at > 0.0);

    auto chunks = docs.document_chunks(id);
    REQUIRE(chunks.size() == 4);
    for (size_t i = 0; i < chunks.size(); i++) {
        REQUIRE(chunks[i].sequence_no == static_cast<int64_t>(i));
        REQUIRE(chunks[i].text.size() <= 1200);
        REQUIRE(chunks[i].source == "manual.txt");
    }
    REQUIRE(chunks[0].text == std::string(750, 'a'));
}

TEST_CASE("DocumentIndex: same label ingested twice is two documents", "[document_index]") {
    TempDbFile file("doc_twice");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    auto first = docs.ingest_text("notes", "one");
    auto second = docs.ingest_text("notes", "two");
    REQUIRE(first != second);
    REQUIRE(docs.list_documents().size() == 2);
}

TEST_CASE("DocumentIndex: invalid input throws and writes nothing", "[document_index]") {
    TempDbFile file("doc_invalid");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    REQUIRE_THROWS_AS(docs.ingest_text("", "text"), InvalidInput);
    REQUIRE_THROWS_AS(docs.ingest_text("label", ""), InvalidInput);
    REQUIRE_THROWS_AS(docs.ingest_text("label", " \n\n \t"), InvalidInput);
    REQUIRE(docs.list_documents().empty());
    REQUIRE_FALSE(docs.is_stale());
}

TEST_CASE("DocumentIndex: ingest_file reads from disk", "[document_index]") {
    TempDbFile file("doc_file");
    TempDbFile text_file("doc_file_txt");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    REQUIRE(atomic_write_file(text_file.path, "The boiler service is every October.\n"));

    auto id = docs.ingest_file(text_file.path);
    auto list = docs.list_documents();
    REQUIRE(list.size() == 1);
    REQUIRE(list[0].source == text_file.path);

    auto labelled = docs.ingest_file(text_file.path, "boiler", "Boiler");
    REQUIRE(labelled != id);
    REQUIRE(docs.list_documents()[1].source == "boiler");

    REQUIRE_THROWS_AS(docs.ingest_file("/nonexistent/lunacore/doc.txt"), InvalidInput);
}

// ── Index lifecycle ──────────────────────────────────────────

TEST_CASE("DocumentIndex: retrieve before rebuild is empty", "[document_index]") {
    TempDbFile file("doc_unbuilt");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    REQUIRE(docs.retrieve("anything").empty());
    REQUIRE(docs.indexed_chunks() == 0);
    REQUIRE(docs.snapshot() == nullptr);

    docs.ingest_text("wifi", "The wifi password is on the router label.");
    REQUIRE(docs.is_stale());
    REQUIRE(docs.retrieve("wifi password").empty());
}

TEST_CASE("DocumentIndex: rebuild makes documents searchable", "[document_index]") {
    TempDbFile file("doc_rebuild");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    auto wifi = docs.ingest_text("wifi", "The wifi password is on the router label.");
    docs.ingest_text("kitchen", "The pantry is to the left of the fridge.");
    docs.rebuild_index();

    REQUIRE_FALSE(docs.is_stale());
    REQUIRE(docs.indexed_chunks() == 2);

    auto results = docs.retrieve("wifi password");
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].document_id == wifi);
    REQUIRE(results[0].source == "wifi");
    REQUIRE(results[0].sequence_no == 0);
    REQUIRE(results[0].score > 0.0);
}

TEST_CASE("DocumentIndex: new ingest is invisible until next rebuild", "[document_index]") {
    TempDbFile file("doc_stale");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    docs.ingest_text("a", "alpha notes");
    docs.rebuild_index();
    docs.ingest_text("b", "boiler notes");

    REQUIRE(docs.is_stale());
    REQUIRE(docs.retrieve("boiler").empty());
    docs.rebuild_index();
    REQUIRE(docs.retrieve("boiler").size() == 1);
}

TEST_CASE("DocumentIndex: explicit k and min_score override defaults", "[document_index]") {
    TempDbFile file("doc_params");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    for (int i = 0; i < 8; i++) {
        docs.ingest_text("lamp" + std::to_string(i), "lamp manual page " + std::to_string(i));
    }
    docs.ingest_text("other", "unrelated");
    docs.rebuild_index();

    REQUIRE(docs.retrieve("lamp").size() == 5);
    REQUIRE(docs.retrieve("lamp", 2, 0.0).size() == 2);
    REQUIRE(docs.retrieve("lamp", 10, 0.0).size() == 8);
    REQUIRE(docs.retrieve("lamp", 10, 1000.0).empty());
}

TEST_CASE("DocumentIndex: delete_all clears storage and index", "[document_index]") {
    TempDbFile file("doc_delete_all");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    auto id = docs.ingest_text("wifi", "The wifi password is on the router label.");
    docs.rebuild_index();
    REQUIRE(docs.retrieve("wifi").size() == 1);

    docs.delete_all();
    REQUIRE(docs.list_documents().empty());
    REQUIRE(docs.document_chunks(id).empty());
    REQUIRE(docs.retrieve("wifi").empty());
    REQUIRE(docs.indexed_chunks() == 0);
    REQUIRE_FALSE(docs.is_stale());
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("DocumentIndex: retrieve during rebuild sees a whole index", "[document_index]") {
    TempDbFile file("doc_concurrent");
    Database db(file.path);
    DocumentIndex docs(db, knowledge_config());

    docs.ingest_text("wifi", "The wifi password is on the router label.");
    docs.rebuild_index();

    std::atomic<bool> done{false};
    std::atomic<int> bad{0};
    std::thread reader([&] {
        while (!done.load()) {
            auto results = docs.retrieve("wifi password", 5, 0.0);
            if (results.empty() || results[0].source != "wifi") bad++;
        }
    });

    for (int i = 0; i < 20; i++) {
        docs.ingest_text("note" + std::to_string(i), "garden note number " + std::to_string(i));
        docs.rebuild_index();
    }
    done.store(true);
    reader.join();

    REQUIRE(bad.load() == 0);
    REQUIRE(docs.indexed_chunks() == 21);
}
