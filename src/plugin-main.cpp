#define WIN32_LEAN_AND_MEAN
#include <winsock2.h>
#include <obs-module.h>
#include <obs-frontend-api.h>
#include <util/platform.h>
#include "ble-adapter.hpp"
#include "vitals-monitor.hpp"
#include <windows.h>
#include <shellapi.h>
#include <algorithm>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>
#include <string>
#include <sstream>
#include <fstream>
#include "httplib.h"

OBS_DECLARE_MODULE()
OBS_MODULE_USE_DEFAULT_LOCALE("health-vitals", "en-US")

static constexpr int kDefaultPort = 17878;
static constexpr int kDefaultScanSeconds = 10;

// Globals
static std::shared_ptr<VitalsMonitor> g_monitor;
static std::unique_ptr<httplib::Server> g_server;
static std::thread g_server_thread;

// Connect and scan workers; joined at unload.
static std::mutex g_workers_mutex;
static std::vector<std::thread> g_workers;
static bool g_unloading = false;
static std::string g_web_dir;
static std::string g_config_path;

static std::mutex g_config_mutex;
static std::string g_last_device_address;
static bool g_auto_connect = true;
static int g_scan_seconds = kDefaultScanSeconds;
static int g_base_port = kDefaultPort;

static std::mutex g_scan_mutex;
static std::vector<DeviceAdvertisement> g_found_devices;
static bool g_scanning = false;

static std::atomic<uint64_t> g_last_update_ms{ 0 };
static int g_server_port = 0;

static void save_config();

static void load_config() {
    char* path = obs_module_config_path("config.json");
    if (!path) {
        blog(LOG_ERROR, "Failed to get module config path");
        return;
    }
    g_config_path = path;
    bfree(path);

    blog(LOG_INFO, "Loading config from: %s", g_config_path.c_str());

    obs_data_t *data = obs_data_create_from_json_file(g_config_path.c_str());
    if (!data) {
        blog(LOG_INFO, "Config file not found or invalid, creating new one.");
        save_config();
        return;
    }

    obs_data_set_default_bool(data, "auto_connect", true);
    obs_data_set_default_int(data, "scan_timeout_seconds", kDefaultScanSeconds);
    obs_data_set_default_int(data, "http_port", kDefaultPort);

    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        const char* address = obs_data_get_string(data, "last_device_address");
        if (address && *address) g_last_device_address = address;
        g_auto_connect = obs_data_get_bool(data, "auto_connect");
        g_scan_seconds = std::clamp((int)obs_data_get_int(data, "scan_timeout_seconds"), 1, 60);
        g_base_port = (int)obs_data_get_int(data, "http_port");
        if (g_base_port <= 0 || g_base_port >= 65535) g_base_port = kDefaultPort;

        blog(LOG_INFO, "Config loaded - Last Device: %s, Auto Connect: %s, Scan: %ds, Port: %d",
             g_last_device_address.c_str(), g_auto_connect ? "yes" : "no", g_scan_seconds, g_base_port);
    }
    obs_data_release(data);
}

static void save_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    if (g_config_path.empty()) return;

    std::string dir_path = g_config_path;
    size_t last_slash = dir_path.find_last_of("/\\");
    if (last_slash != std::string::npos) {
        dir_path = dir_path.substr(0, last_slash);
        os_mkdirs(dir_path.c_str());
    }

    obs_data_t *data = obs_data_create();
    obs_data_set_string(data, "last_device_address", g_last_device_address.c_str());
    obs_data_set_bool(data, "auto_connect", g_auto_connect);
    obs_data_set_int(data, "scan_timeout_seconds", g_scan_seconds);
    obs_data_set_int(data, "http_port", g_base_port);

    if (!obs_data_save_json_safe(data, g_config_path.c_str(), "tmp", "bak")) {
        blog(LOG_WARNING, "Failed to save config to %s", g_config_path.c_str());
    } else {
        blog(LOG_INFO, "Config saved to %s", g_config_path.c_str());
    }

    obs_data_release(data);
}

static void setup_web_dir() {
    char* path = obs_module_file("web");
    if (path) {
        g_web_dir = path;
        bfree(path);
        blog(LOG_INFO, "Web directory found: %s", g_web_dir.c_str());
    } else {
        blog(LOG_WARNING, "Could not find 'web' directory in plugin data path.");
    }
}

static void open_url(const char* url) {
    ShellExecuteA(NULL, "open", url, NULL, NULL, SW_SHOWNORMAL);
}

static std::string get_base_url() {
    return "http://localhost:" + std::to_string(g_server_port);
}

static bool start_worker(std::function<void()> work) {
    std::lock_guard<std::mutex> lock(g_workers_mutex);
    if (g_unloading) return false;
    g_workers.emplace_back(std::move(work));
    return true;
}

// Connects on a worker thread; WinRT calls must not block the UI thread.
static void connect_async(const std::string& address) {
    std::shared_ptr<VitalsMonitor> monitor = g_monitor;
    if (!monitor) return;
    bool started = start_worker([monitor, address]() {
        Status status = monitor->Connect(address);
        if (!status) {
            blog(LOG_WARNING, "Connect to %s failed (%s): %s", address.c_str(),
                 VitalsErrorName(status.error()), status.message().c_str());
        }
    });
    if (!started) {
        blog(LOG_INFO, "Plugin unloading, not connecting to %s", address.c_str());
    }
}

static void check_and_create_source() {
    obs_source_t* scene_source = obs_frontend_get_current_scene();
    if (!scene_source) return;

    obs_scene_t* scene = obs_scene_from_source(scene_source);
    if (!scene || g_server_port == 0) {
        obs_source_release(scene_source);
        return;
    }

    const char* source_name = obs_module_text("VitalsSourceName");
    obs_sceneitem_t* item = obs_scene_find_source_recursive(scene, source_name);
    std::string url = get_base_url() + "/index.html";

    if (item) {
        // The port may differ from the last session
        obs_source_t* source = obs_sceneitem_get_source(item);
        if (source) {
            obs_data_t* settings = obs_source_get_settings(source);
            const char* current_url = obs_data_get_string(settings, "url");
            if (current_url && url != current_url) {
                blog(LOG_INFO, "Updating vitals browser source URL to %s", url.c_str());
                obs_data_set_string(settings, "url", url.c_str());
                obs_source_update(source, settings);
            }
            obs_data_release(settings);
        }
    } else {
        blog(LOG_INFO, "Creating vitals browser source...");
        obs_data_t* settings = obs_data_create();
        obs_data_set_string(settings, "url", url.c_str());
        obs_data_set_int(settings, "width", 420);
        obs_data_set_int(settings, "height", 220);
        obs_data_set_int(settings, "fps", 30);
        obs_data_set_bool(settings, "is_local_file", false);

        obs_source_t* source = obs_source_create("browser_source", source_name, settings, nullptr);
        obs_data_release(settings);

        if (source) {
            obs_sceneitem_t* new_item = obs_scene_add(scene, source);
            if (new_item) {
                obs_sceneitem_set_visible(new_item, true);
            }
            obs_source_release(source);
        }
    }

    obs_source_release(scene_source);
}

static void on_frontend_event(enum obs_frontend_event event, void*) {
    if (event != OBS_FRONTEND_EVENT_FINISHED_LOADING) return;

    check_and_create_source();

    std::string address;
    bool auto_connect;
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        address = g_last_device_address;
        auto_connect = g_auto_connect;
    }
    if (auto_connect && !address.empty() && g_monitor) {
        blog(LOG_INFO, "Auto connecting to last device: %s", address.c_str());
        connect_async(address);
    }
}

static void on_tool_config(void*) {
    if (g_server_port > 0) {
        open_url((get_base_url() + "/settings.html").c_str());
    }
}

// Vitals never read are left out of the JSON.
static void set_optional_int(obs_data_t* data, const char* name, const std::optional<int>& value) {
    if (value) {
        obs_data_set_int(data, name, *value);
    }
}

static void send_json(httplib::Response& res, obs_data_t* data) {
    const char* json = obs_data_get_json(data);
    if (json) {
        res.set_content(json, "application/json");
        res.set_header("Access-Control-Allow-Origin", "*");
    } else {
        res.status = 500;
    }
}

static std::string vitals_json() {
    VitalsSnapshot snapshot = g_monitor ? g_monitor->GetSnapshot() : VitalsSnapshot();
    std::optional<SessionInfo> session = g_monitor ? g_monitor->CurrentSession() : std::nullopt;

    obs_data_t *data = obs_data_create();
    obs_data_set_string(data, "state",
                        SessionStateName(session ? session->state : SessionState::Idle));
    obs_data_set_bool(data, "connected", session && session->state == SessionState::Monitoring);
    obs_data_set_string(data, "device_name", session ? session->name.c_str() : "");
    obs_data_set_string(data, "device_address", session ? session->address.c_str() : "");
    obs_data_set_int(data, "updated_ms", (long long)g_last_update_ms.load());

    obs_data_array_t *services = obs_data_array_create();
    if (session) {
        for (ServiceKind kind : session->supported_services) {
            obs_data_t *item = obs_data_create();
            obs_data_set_string(item, "name", ServiceKindName(kind));
            obs_data_array_push_back(services, item);
            obs_data_release(item);
        }
    }
    obs_data_set_array(data, "services", services);
    obs_data_array_release(services);

    set_optional_int(data, "heart_rate", snapshot.heart_rate_bpm);
    if (snapshot.temperature_f) {
        obs_data_set_double(data, "temperature_f", *snapshot.temperature_f);
    }
    set_optional_int(data, "systolic", snapshot.blood_pressure_systolic);
    set_optional_int(data, "diastolic", snapshot.blood_pressure_diastolic);
    set_optional_int(data, "spo2", snapshot.oxygen_saturation_pct);
    set_optional_int(data, "battery", snapshot.battery_pct);

    const char* json = obs_data_get_json(data);
    std::string out = json ? json : "{}";
    obs_data_release(data);
    return out;
}

static void start_http_server() {
    g_server = std::make_unique<httplib::Server>();

    struct StaticFile {
        const char* route;
        const char* file;
        const char* mime;
    };
    static const StaticFile kStaticFiles[] = {
        { "/", "index.html", "text/html" },
        { "/index.html", "index.html", "text/html" },
        { "/settings.html", "settings.html", "text/html" },
        { "/style.css", "style.css", "text/css" },
        { "/script.js", "script.js", "application/javascript" },
    };
    for (const StaticFile& entry : kStaticFiles) {
        std::string file_path = g_web_dir + "/" + entry.file;
        std::string mime = entry.mime;
        g_server->Get(entry.route, [file_path, mime](const httplib::Request&, httplib::Response& res) {
            std::ifstream in(file_path, std::ios::binary);
            if (!in) {
                res.status = 404;
                res.set_content("Not found", "text/plain");
                return;
            }
            std::stringstream content;
            content << in.rdbuf();
            res.set_content(content.str(), mime);
        });
    }

    g_server->Get("/api/vitals", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(vitals_json(), "application/json");
        res.set_header("Access-Control-Allow-Origin", "*");
    });

    g_server->Post("/api/disconnect", [](const httplib::Request&, httplib::Response& res) {
        if (!g_monitor) {
            res.status = 500;
            return;
        }
        g_monitor->Disconnect();
        res.set_content("{\"status\": \"disconnected\"}", "application/json");
    });

    g_server->Post("/api/reset", [](const httplib::Request&, httplib::Response& res) {
        if (g_monitor) {
            g_monitor->Disconnect();
        }
        {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            g_last_device_address = "";
        }
        save_config();
        res.set_content("{\"status\": \"reset\"}", "application/json");
    });

    g_server->Post("/api/scan", [](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(g_scan_mutex);
        if (g_scanning) {
            res.set_content("{\"status\": \"scanning\"}", "application/json");
            return;
        }
        if (!g_monitor) {
            res.status = 500;
            return;
        }
        g_scanning = true;
        g_found_devices.clear();

        int seconds;
        {
            std::lock_guard<std::mutex> config_lock(g_config_mutex);
            seconds = g_scan_seconds;
        }
        bool started = start_worker([monitor = g_monitor, seconds]() {
            std::vector<DeviceAdvertisement> devices = monitor->Scan(std::chrono::seconds(seconds));
            std::lock_guard<std::mutex> lock(g_scan_mutex);
            g_found_devices = std::move(devices);
            g_scanning = false;
        });
        if (!started) {
            g_scanning = false;
            res.status = 503;
            return;
        }

        res.set_content("{\"status\": \"started\"}", "application/json");
    });

    g_server->Get("/api/devices", [](const httplib::Request&, httplib::Response& res) {
        obs_data_t *data = obs_data_create();
        obs_data_array_t *devices = obs_data_array_create();
        {
            std::lock_guard<std::mutex> lock(g_scan_mutex);
            obs_data_set_bool(data, "scanning", g_scanning);
            for (const auto& dev : g_found_devices) {
                obs_data_t *item = obs_data_create();
                obs_data_set_string(item, "name", dev.name ? dev.name->c_str() : "Unknown");
                obs_data_set_string(item, "address", dev.address.c_str());
                obs_data_set_int(item, "rssi", dev.rssi);
                obs_data_array_push_back(devices, item);
                obs_data_release(item);
            }
        }
        obs_data_set_array(data, "devices", devices);
        obs_data_array_release(devices);
        send_json(res, data);
        obs_data_release(data);
    });

    g_server->Post("/api/connect", [](const httplib::Request& req, httplib::Response& res) {
        std::string address;
        obs_data_t *data = obs_data_create_from_json(req.body.c_str());
        if (data) {
            const char* val = obs_data_get_string(data, "address");
            if (val) address = val;
            obs_data_release(data);
        }
        if (address.empty()) {
            blog(LOG_WARNING, "Connect request without address: %s", req.body.c_str());
            res.status = 400;
            return;
        }
        if (!g_monitor) {
            res.status = 500;
            return;
        }

        {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            g_last_device_address = address;
        }
        save_config();
        connect_async(address);
        res.set_content("{\"status\": \"connecting\"}", "application/json");
    });

    int port;
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        port = g_base_port;
    }
    int first_port = port;
    while (port < 65535) {
        if (g_server->bind_to_port("0.0.0.0", port)) {
            g_server_port = port;
            blog(LOG_INFO, "HTTP Server started on port %d", g_server_port);
            g_server->listen_after_bind();
            return;
        }
        port++;
    }
    blog(LOG_ERROR, "Failed to bind to any port starting from %d", first_port);
}

bool obs_module_load(void)
{
    setup_web_dir();
    load_config();

    g_monitor = std::make_shared<VitalsMonitor>(BleAdapter::Create());
    g_monitor->Subscribe([](const VitalsSnapshot&, std::chrono::system_clock::time_point timestamp) {
        g_last_update_ms = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                               timestamp.time_since_epoch()).count();
    });
    g_monitor->SetLinkLostCallback([](const std::string& address) {
        blog(LOG_WARNING, "Lost connection to %s, reconnect from the settings page", address.c_str());
    });

    g_server_thread = std::thread(start_http_server);
    g_server_thread.detach();

    // Give the server up to 2 s to bind so the browser source gets a port
    int retries = 0;
    while (g_server_port == 0 && retries < 20) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        retries++;
    }

    obs_frontend_add_tools_menu_item(obs_module_text("ToolsMenuItem"), on_tool_config, nullptr);
    obs_frontend_add_event_callback(on_frontend_event, nullptr);

    blog(LOG_INFO, "Health vitals plugin loaded");
    return true;
}

void obs_module_unload(void)
{
    if (g_server) {
        g_server->stop();
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(g_workers_mutex);
        g_unloading = true;
        workers.swap(g_workers);
    }
    // Scans and connects are bounded by their timeouts.
    for (auto& worker : workers) {
        worker.join();
    }

    if (g_monitor) {
        g_monitor->Disconnect();
        g_monitor.reset();
    }
    blog(LOG_INFO, "Health vitals plugin unloaded");
}
