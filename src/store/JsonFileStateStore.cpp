#include "aegis/store/JsonFileStateStore.hpp"
#include "aegis/infra/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace aegis {

static const char* HEX = "0123456789ABCDEF";

JsonFileStateStore::JsonFileStateStore(const std::string& root)
    : root_(root),
      docs_dir_(root_ / "docs"),
      logs_dir_(root_ / "logs"),
      redo_path_(root_ / "batch.redo") {
    std::error_code ec;
    fs::create_directories(docs_dir_, ec);
    if (ec) throw StoreFailure("cannot create " + docs_dir_.string() + ": " + ec.message());
    fs::create_directories(logs_dir_, ec);
    if (ec) throw StoreFailure("cannot create " + logs_dir_.string() + ": " + ec.message());

    recover();
}

std::string JsonFileStateStore::encode_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string JsonFileStateStore::decode_key(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '%' && i + 2 < name.size()) {
            out.push_back(static_cast<char>(std::stoi(name.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(name[i]);
        }
    }
    return out;
}

fs::path JsonFileStateStore::doc_path(const std::string& key) const {
    return docs_dir_ / (encode_key(key) + ".json");
}

fs::path JsonFileStateStore::log_path(const std::string& log) const {
    return logs_dir_ / (encode_key(log) + ".jsonl");
}

void JsonFileStateStore::write_atomic(const fs::path& path, const std::string& data) {
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!out) throw StoreFailure("cannot open " + tmp.string());
        out << data;
        out.flush();
        if (!out) throw StoreFailure("write failed: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) throw StoreFailure("rename " + tmp.string() + " failed: " + ec.message());
}

void JsonFileStateStore::recover() {
    // Leftover temp files are from writes that never reached rename.
    std::error_code ec;
    for (const auto& dir : { root_, docs_dir_ }) {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (entry.path().extension() == ".tmp") {
                fs::remove(entry.path(), ec);
            }
        }
    }

    if (!fs::exists(redo_path_)) return;

    std::ifstream in(redo_path_);
    json redo;
    try {
        in >> redo;
    } catch (const json::exception& e) {
        std::cerr << "[STORE] Unreadable redo batch discarded: " << e.what() << "\n";
        fs::remove(redo_path_, ec);
        return;
    }

    WriteBatch batch;
    for (const auto& p : redo.at("puts")) {
        batch.put(p.at(0).get<std::string>(), p.at(1));
    }
    for (const auto& k : redo.at("erases")) {
        batch.erase(k.get<std::string>());
    }

    apply(batch);
    fs::remove(redo_path_, ec);
    std::cout << "[STORE] Replayed pending batch (" << batch.puts.size()
              << " puts, " << batch.erases.size() << " erases)\n";
}

void JsonFileStateStore::apply(const WriteBatch& batch) {
    for (const auto& kv : batch.puts) {
        write_atomic(doc_path(kv.first), kv.second.dump(2));
    }
    for (const auto& key : batch.erases) {
        std::error_code ec;
        fs::remove(doc_path(key), ec);
        if (ec) throw StoreFailure("erase " + key + " failed: " + ec.message());
    }
}

std::optional<json> JsonFileStateStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ifstream in(doc_path(key));
    if (!in.is_open()) return std::nullopt;

    try {
        json doc;
        in >> doc;
        return doc;
    } catch (const json::exception& e) {
        throw StoreFailure("corrupt document '" + key + "': " + e.what());
    }
}

std::vector<std::pair<std::string, json>>
JsonFileStateStore::scan(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mtx_);

    std::vector<std::pair<std::string, json>> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(docs_dir_, ec)) {
        if (entry.path().extension() != ".json") continue;

        std::string key = decode_key(entry.path().stem().string());
        if (key.compare(0, prefix.size(), prefix) != 0) continue;

        std::ifstream in(entry.path());
        try {
            json doc;
            in >> doc;
            out.emplace_back(key, std::move(doc));
        } catch (const json::exception& e) {
            throw StoreFailure("corrupt document '" + key + "': " + e.what());
        }
    }
    if (ec) throw StoreFailure("scan " + docs_dir_.string() + " failed: " + ec.message());

    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

void JsonFileStateStore::commit(const WriteBatch& batch) {
    if (batch.empty()) return;

    std::lock_guard<std::mutex> lock(mtx_);

    if (batch.puts.size() + batch.erases.size() == 1) {
        apply(batch);
        return;
    }

    json redo;
    redo["puts"] = json::array();
    for (const auto& kv : batch.puts) {
        redo["puts"].push_back(json::array({ kv.first, kv.second }));
    }
    redo["erases"] = batch.erases;

    write_atomic(redo_path_, redo.dump());
    apply(batch);

    std::error_code ec;
    fs::remove(redo_path_, ec);
    if (ec) throw StoreFailure("cannot clear redo batch: " + ec.message());
}

void JsonFileStateStore::append(const std::string& log, const json& record) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream out(log_path(log), std::ios::out | std::ios::app);
    if (!out) throw StoreFailure("cannot open log " + log);
    out << record.dump() << "\n";
    out.flush();
    if (!out) throw StoreFailure("append to log " + log + " failed");
}

std::vector<json> JsonFileStateStore::read_log(const std::string& log) const {
    std::lock_guard<std::mutex> lock(mtx_);

    std::vector<json> out;
    std::ifstream in(log_path(log));
    if (!in.is_open()) return out;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            out.push_back(json::parse(line));
        } catch (const json::exception& e) {
            std::cerr << "[STORE] Skipping unreadable record " << log << ":" << line_no
                      << " (" << e.what() << ")\n";
        }
    }
    return out;
}

} // namespace aegis
