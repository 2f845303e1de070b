#pragma once
#include <cstdint>
#include <string>
#include <map>
#include <fstream>
#include <mutex>
#include <Eigen/Dense>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <sstream>

// Writes one CSV file per named stream into a per-session directory.
// Rows are "timestamp,v0,v1,...".
class Logger {
public:
    explicit Logger(const std::string& root_dir = "logs") : root_dir(root_dir) {
        startNewSession();
    }

    ~Logger() {
        closeAll();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void startNewSession() {
        std::lock_guard<std::mutex> lock(mtx);
        closeAll();

        // Create new directory based on time
        auto t = std::time(nullptr);
        auto tm = *std::localtime(&t);
        std::ostringstream oss;
        oss << root_dir << "/" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
        session_dir = oss.str();

        // Two sessions in the same second get a numeric suffix
        std::string candidate = session_dir;
        for (int i = 1; std::filesystem::exists(candidate); i++) {
            candidate = session_dir + "_" + std::to_string(i);
        }
        session_dir = candidate;

        std::error_code ec;
        std::filesystem::create_directories(session_dir, ec);
        if (ec) {
            std::cerr << "[Logger] Failed to create " << session_dir << ": " << ec.message() << std::endl;
            return;
        }
        std::cout << "[Logger] Started new session: " << session_dir << std::endl;
    }

    template <typename Derived>
    void log(const std::string& name, const Eigen::MatrixBase<Derived>& data, uint64_t timestamp) {
        std::lock_guard<std::mutex> lock(mtx);
        std::ofstream* file = ensureFileOpen(name);
        if (file == nullptr)
            return;

        *file << timestamp;
        if (data.size() > 0) {
            static const Eigen::IOFormat CSVFormat(Eigen::StreamPrecision, Eigen::DontAlignCols, ",", ",");
            *file << "," << data.format(CSVFormat);
        }
        *file << "\n";
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& pair : files) {
            if (pair.second.is_open()) pair.second.flush();
        }
    }

    std::string getSessionDir() const {
        std::lock_guard<std::mutex> lock(mtx);
        return session_dir;
    }

private:
    void closeAll() {
        for (auto& pair : files) {
            if (pair.second.is_open()) pair.second.close();
        }
        files.clear();
    }

    std::ofstream* ensureFileOpen(const std::string& name) {
        auto it = files.find(name);
        if (it == files.end()) {
            std::string path = session_dir + "/" + name + ".csv";
            it = files.emplace(name, std::ofstream(path)).first;
            if (!it->second.is_open()) {
                std::cerr << "[Logger] Failed to open file: " << path << std::endl;
            }
        }
        return it->second.is_open() ? &it->second : nullptr;
    }

    std::string root_dir;
    std::string session_dir;
    std::map<std::string, std::ofstream> files;
    mutable std::mutex mtx;
};
