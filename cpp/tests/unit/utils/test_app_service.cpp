#include "doctest.h"
#include "../../../utils/app_service/app_service.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

namespace {

class RecordingService : public app_service::AppService {
public:
    RecordingService() : AppService("Recording", "recording_service_test") {}
    ~RecordingService() override { stop(); }

    bool configure_ok{true};
    bool start_ok{true};
    std::atomic<int> configured{0};
    std::atomic<int> started{0};
    std::atomic<int> stopped{0};
    std::string seen_value;

    using AppService::get_config_file;

protected:
    bool configure_service() override {
        configured++;
        seen_value = get_config_manager()->get_string("recording", "value", "unset");
        return configure_ok;
    }
    bool start_service() override {
        started++;
        return start_ok;
    }
    void stop_service() override { stopped++; }
    void print_service_stats() override {}
};

bool init_with(RecordingService& service, std::vector<std::string> args) {
    args.insert(args.begin(), "recording_service_test");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return service.initialize(static_cast<int>(argv.size()), argv.data());
}

}

TEST_CASE("AppService - Missing Default Config Is Optional") {
    RecordingService service;
    REQUIRE(init_with(service, {}));
    CHECK(service.configured.load() == 1);
    CHECK(service.seen_value == "unset");
    CHECK(service.get_config_file() == "config/recording_service_test.ini");
    CHECK(service.get_stats_interval() == 60);
}

TEST_CASE("AppService - Explicit Config Must Load") {
    RecordingService missing;
    CHECK_FALSE(init_with(missing, {"--config", "does_not_exist.ini"}));
    CHECK(missing.configured.load() == 0);

    {
        std::ofstream file("recording_service_test.ini");
        file << "[recording]\nvalue = from-file\n";
    }
    RecordingService loaded;
    REQUIRE(init_with(loaded, {"--config=recording_service_test.ini", "--stats-interval", "5"}));
    CHECK(loaded.seen_value == "from-file");
    CHECK(loaded.get_stats_interval() == 5);
    std::remove("recording_service_test.ini");
}

TEST_CASE("AppService - Command Line Errors") {
    RecordingService help;
    CHECK_FALSE(init_with(help, {"--help"}));
    CHECK(help.help_requested());

    RecordingService unknown;
    CHECK_FALSE(init_with(unknown, {"--daemon"}));
    CHECK_FALSE(unknown.help_requested());

    RecordingService bad_interval;
    CHECK_FALSE(init_with(bad_interval, {"--stats-interval", "0"}));

    RecordingService missing_value;
    CHECK_FALSE(init_with(missing_value, {"--config"}));

    RecordingService rejected;
    rejected.configure_ok = false;
    CHECK_FALSE(init_with(rejected, {}));
}

TEST_CASE("AppService - Start Blocks Until Shutdown Requested") {
    RecordingService service;
    REQUIRE(init_with(service, {}));

    std::thread stopper([&service]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        service.request_shutdown();
    });
    int exit_code = service.start();
    stopper.join();

    CHECK(exit_code == 0);
    CHECK(service.started.load() == 1);
    CHECK(service.stopped.load() == 1);
    CHECK_FALSE(service.is_running());
    CHECK(service.uptime_seconds() == 0);
}

TEST_CASE("AppService - Failed Start Unwinds") {
    RecordingService service;
    service.start_ok = false;
    REQUIRE(init_with(service, {}));

    CHECK(service.start() == 1);
    CHECK(service.stopped.load() == 1);
    CHECK_FALSE(service.is_running());
}
