/**
 * BrlsWebImage - Application implementation
 */

#include "app/application.hpp"
#include "app/http_image_manager.hpp"
#include "activity/gallery_activity.hpp"
#include "utils/http_client.hpp"
#include "utils/image_loader.hpp"

#include <borealis.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef __vita__
#include <psp2/io/stat.h>
#endif

namespace webimage {

#ifdef __vita__
static const char* SETTINGS_DIR = "ux0:data/BrlsWebImage";
static const char* SETTINGS_PATH = "ux0:data/BrlsWebImage/settings.json";
#else
static const char* SETTINGS_PATH = "./settings.json";
#endif

// Largest settings file we accept
static const std::streamoff SETTINGS_MAX_SIZE = 16384;

bool parseSettings(const std::string& content, AppSettings& settings) {
    if (content.find('{') == std::string::npos) return false;

    auto findValue = [&content](const std::string& key) -> size_t {
        std::string search = "\"" + key + "\":";
        size_t pos = content.find(search);
        if (pos == std::string::npos) return std::string::npos;
        pos += search.length();
        // Skip whitespace after colon
        while (pos < content.length() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        return pos < content.length() ? pos : std::string::npos;
    };

    auto extractString = [&content, &findValue](const std::string& key, std::string& out) {
        size_t pos = findValue(key);
        if (pos == std::string::npos || content[pos] != '"') return;
        pos++; // Skip opening quote
        std::string value;
        for (; pos < content.length(); pos++) {
            char c = content[pos];
            if (c == '"') {
                out = value;
                return;
            }
            if (c == '\\') {
                if (++pos >= content.length()) return;
                c = content[pos];
                if (c == 'n') c = '\n';
                else if (c == 't') c = '\t';
            }
            value += c;
        }
        // Unterminated, keep the default
    };

    auto extractInt = [&content, &findValue](const std::string& key, int& out) {
        size_t pos = findValue(key);
        if (pos == std::string::npos) return;
        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) return;
        std::string value = content.substr(pos, end - pos);
        if (value.empty() || (value[0] != '-' && (value[0] < '0' || value[0] > '9'))) return;
        out = atoi(value.c_str());
    };

    auto extractBool = [&content, &findValue](const std::string& key, bool& out) {
        size_t pos = findValue(key);
        if (pos == std::string::npos) return;
        if (content.compare(pos, 4, "true") == 0) {
            out = true;
        } else if (content.compare(pos, 5, "false") == 0) {
            out = false;
        }
    };

    extractBool("debugLogging", settings.debugLogging);
    extractBool("showProgressIndicator", settings.showProgressIndicator);

    extractBool("transitionsEnabled", settings.transitionsEnabled);
    extractInt("transitionDuration", settings.transitionDuration);
    if (settings.transitionDuration < 0) settings.transitionDuration = 0;
    extractBool("waitForTransition", settings.waitForTransition);
    extractBool("delayPlaceholder", settings.delayPlaceholder);

    extractInt("memoryCacheLimit", settings.memoryCacheLimit);
    if (settings.memoryCacheLimit <= 0) settings.memoryCacheLimit = 30;
    extractInt("connectionTimeout", settings.connectionTimeout);
    if (settings.connectionTimeout <= 0) settings.connectionTimeout = 30;

    extractString("galleryUrls", settings.galleryUrls);
    return true;
}

std::string escapeJsonString(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string serializeSettings(const AppSettings& settings) {
    std::string json = "{\n";

    // UI settings
    json += "  \"debugLogging\": " + std::string(settings.debugLogging ? "true" : "false") + ",\n";
    json += "  \"showProgressIndicator\": " + std::string(settings.showProgressIndicator ? "true" : "false") + ",\n";

    // Presentation settings
    json += "  \"transitionsEnabled\": " + std::string(settings.transitionsEnabled ? "true" : "false") + ",\n";
    json += "  \"transitionDuration\": " + std::to_string(settings.transitionDuration) + ",\n";
    json += "  \"waitForTransition\": " + std::string(settings.waitForTransition ? "true" : "false") + ",\n";
    json += "  \"delayPlaceholder\": " + std::string(settings.delayPlaceholder ? "true" : "false") + ",\n";

    // Network settings
    json += "  \"memoryCacheLimit\": " + std::to_string(settings.memoryCacheLimit) + ",\n";
    json += "  \"connectionTimeout\": " + std::to_string(settings.connectionTimeout) + ",\n";

    json += "  \"galleryUrls\": \"" + escapeJsonString(settings.galleryUrls) + "\"\n";

    json += "}\n";
    return json;
}

std::vector<std::string> splitUrlList(const std::string& list) {
    std::vector<std::string> urls;
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        while (!item.empty() && (item[0] == ' ' || item[0] == '\t')) item.erase(0, 1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.pop_back();
        if (!item.empty()) urls.push_back(item);
    }
    return urls;
}

Application& Application::getInstance() {
    static Application instance;
    return instance;
}

bool Application::init() {
    brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
    brls::Logger::info("BrlsWebImage {} initializing...", BRLS_WEBIMAGE_VERSION);

#ifdef __vita__
    // Create data directory
    int ret = sceIoMkdir(SETTINGS_DIR, 0777);
    brls::Logger::debug("sceIoMkdir result: {:#x}", ret);
#endif

    bool loaded = loadSettings();
    brls::Logger::info("Settings load result: {}", loaded ? "success" : "failed/not found");

    applyLogLevel();

    if (!HttpClient::globalInit()) {
        brls::Logger::error("Application: HTTP unavailable, images will fail to load");
    }

    ImageLoader::setDefaultManager(std::make_shared<HttpImageManager>());
    applyImageSettings();

    m_initialized = true;
    return true;
}

void Application::run() {
    pushGalleryActivity();

    // Main loop handled by Borealis
    while (brls::Application::mainLoop()) {
        // Application keeps running
    }
}

void Application::shutdown() {
    if (!m_initialized) return;

    saveSettings();
    ImageLoader::setDefaultManager(nullptr);
    HttpClient::globalCleanup();
    m_initialized = false;
    brls::Logger::info("BrlsWebImage shutting down");
}

void Application::pushGalleryActivity() {
    brls::Application::pushActivity(new GalleryActivity());
}

void Application::applyLogLevel() {
    if (m_settings.debugLogging) {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
        brls::Logger::info("Debug logging enabled");
    } else {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_INFO);
        brls::Logger::info("Debug logging disabled");
    }
}

void Application::applyImageSettings() {
    auto manager = std::dynamic_pointer_cast<HttpImageManager>(ImageLoader::getDefaultManager());
    if (!manager) return;
    manager->setMemoryCacheLimit((size_t)m_settings.memoryCacheLimit);
    manager->setTimeout(m_settings.connectionTimeout);
}

bool Application::loadSettings() {
    brls::Logger::debug("loadSettings: Opening {}", SETTINGS_PATH);

    std::ifstream file(SETTINGS_PATH, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        brls::Logger::debug("No settings file found");
        return false;
    }

    std::streamoff size = file.tellg();
    if (size <= 0 || size > SETTINGS_MAX_SIZE) {
        brls::Logger::error("loadSettings: Invalid file size {}", (long long)size);
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::string content;
    content.resize((size_t)size);
    if (!file.read(&content[0], size)) {
        brls::Logger::error("loadSettings: Failed to read {}", SETTINGS_PATH);
        return false;
    }

    if (!parseSettings(content, m_settings)) {
        brls::Logger::error("loadSettings: {} holds no settings", SETTINGS_PATH);
        return false;
    }

    brls::Logger::info("Settings loaded successfully");
    return true;
}

bool Application::saveSettings() {
    brls::Logger::info("saveSettings: Saving to {}", SETTINGS_PATH);

    std::string json = serializeSettings(m_settings);

    std::ofstream file(SETTINGS_PATH, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        brls::Logger::error("Failed to open settings file for writing");
        return false;
    }

    file.write(json.c_str(), (std::streamsize)json.length());
    if (!file) {
        brls::Logger::error("Failed to write settings ({} bytes)", json.length());
        return false;
    }

    brls::Logger::info("Settings saved successfully ({} bytes)", json.length());
    return true;
}

} // namespace webimage
