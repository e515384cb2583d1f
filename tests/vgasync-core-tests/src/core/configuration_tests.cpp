#include <catch2/catch_test_macros.hpp>

#include <vgasync/vgasync.hpp>

#include <string>
#include <vector>

using namespace vgasync;

TEST_CASE("Observable values notify their observers", "[core][config]") {
    util::Observable<int> value = 5;

    std::vector<int> seen{};
    value.Observe([&](const int &v) { seen.push_back(v); });
    CHECK(seen.empty());

    int mirror = 0;
    value.Observe(mirror);

    value = 10;
    CHECK(seen == std::vector<int>{10});
    CHECK(mirror == 10);
    CHECK(value.Get() == 10);

    value.Notify();
    CHECK(seen == std::vector<int>{10, 10});

    std::vector<int> late{};
    value.ObserveAndNotify([&](const int &v) { late.push_back(v); });
    CHECK(late == std::vector<int>{10});
}

TEST_CASE("Display system follows the preset configuration", "[core][config][system]") {
    DisplaySystem system{};

    SECTION("known preset") {
        system.configuration.video.preset = std::string{"1024x768@60"};
        CHECK(system.GetProfile() == vga::FindPreset("1024x768@60")->profile);
        CHECK(system.GetPixelClockHz() == 65'000'000);
    }

    SECTION("preset names are case-insensitive") {
        system.configuration.video.preset = std::string{"640X480@72"};
        CHECK(system.GetProfile() == vga::FindPreset("640x480@72")->profile);
    }

    SECTION("unknown preset keeps the current profile") {
        system.configuration.video.preset = std::string{"800x600@72"};
        system.configuration.video.preset = std::string{"does not exist"};
        CHECK(system.GetProfile() == vga::FindPreset("800x600@72")->profile);
        CHECK(system.GetPixelClockHz() == 50'000'000);
    }

    SECTION("reapplying the current preset does not restart the generator") {
        system.RunTicks(1234);
        system.configuration.NotifyObservers();
        CHECK(system.GetClock().GetTickCount() == 2 + 1234);
    }
}
