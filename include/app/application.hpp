/**
 * BrlsWebImage - Image gallery for borealis
 * Borealis-based Application
 */

#pragma once

#include <string>
#include <vector>

// Application version
#define BRLS_WEBIMAGE_VERSION "1.0.0"

namespace webimage {

// Application settings structure
struct AppSettings {
    // UI Settings
    bool debugLogging = true;       // Enable debug logging
    bool showProgressIndicator = true;

    // Image presentation
    bool transitionsEnabled = true;
    int transitionDuration = 300;   // ms
    bool waitForTransition = false; // Report a load only once its transition finished
    bool delayPlaceholder = false;  // Show the placeholder only when a load fails

    // Network / cache Settings
    int memoryCacheLimit = 30;      // images kept in memory
    int connectionTimeout = 30;     // seconds

    std::string galleryUrls;        // Comma-separated list of image urls
};

// Reads the settings file content into settings. Keys missing from content keep
// their current value. Returns false when content holds no settings at all.
bool parseSettings(const std::string& content, AppSettings& settings);

std::string serializeSettings(const AppSettings& settings);

// Backslash-escapes quotes, backslashes, newlines and tabs for a JSON string
std::string escapeJsonString(const std::string& value);

// Splits galleryUrls, dropping blanks
std::vector<std::string> splitUrlList(const std::string& list);

/**
 * Application singleton - manages app lifecycle and global state
 */
class Application {
public:
    static Application& getInstance();

    // Initialize and run the application
    bool init();
    void run();
    void shutdown();

    // Navigation
    void pushGalleryActivity();

    // Settings persistence
    bool loadSettings();
    bool saveSettings();

    // Application settings access
    AppSettings& getSettings() { return m_settings; }
    const AppSettings& getSettings() const { return m_settings; }

    // Apply log level based on settings
    void applyLogLevel();

    // Push cache and timeout settings to the default image manager
    void applyImageSettings();

private:
    Application() = default;
    ~Application() = default;
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool m_initialized = false;
    AppSettings m_settings;
};

} // namespace webimage
