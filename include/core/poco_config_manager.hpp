#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide JSON configuration store backed by Poco JSONConfiguration.
 *
 * Keys are dotted paths ("video_hash.grid_size"). Every getter takes a
 * default that is returned when the key is missing.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Replace the current configuration with the contents of a JSON file
     * @param path Path to the JSON file
     * @return false if the file could not be opened or parsed
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a (possibly nested) JSON patch into the configuration
     * @param patch Objects are flattened into dotted keys
     */
    void update(const nlohmann::json &patch);

    /**
     * @brief Drop all values and reinstate the built-in defaults
     */
    void resetToDefaults();

    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    bool getBool(const std::string &key, bool def = false) const;

private:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
