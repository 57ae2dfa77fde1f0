#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace FileCourier {

    /**
     * @brief Flat key=value settings store
     *
     * File format: one "key = value" per line, '#' starts a comment line.
     * Later files in loadLayered() override earlier ones unless
     * overrideExisting is false.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;
        Config(const Config& other);
        Config& operator=(const Config& other);

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        bool getBool(const std::string& key, bool defaultValue = false) const;

        /**
         * @brief Run validators against the keys that are present
         * @param failedKey Receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
