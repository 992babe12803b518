#include "geo.hpp"
#include "geocache.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

class GeoTest {
public:
    static bool run_all_tests() {
        std::cout << "Running geo and geocache tests..." << std::endl;

        bool all_passed = true;

        all_passed &= test_haversine_properties();
        all_passed &= test_haversine_known_distance();
        all_passed &= test_haversine_antipodal();
        all_passed &= test_round2();
        all_passed &= test_geocache_from_json();
        all_passed &= test_geocache_rejects_malformed();
        all_passed &= test_geocache_candidate_order();
        all_passed &= test_geocache_all_candidates_fail();

        if (all_passed) {
            std::cout << "✅ All geo tests passed!" << std::endl;
        } else {
            std::cout << "❌ Some geo tests failed!" << std::endl;
        }
        return all_passed;
    }

private:
    static bool report(bool ok, const char *name) {
        std::cout << "    " << (ok ? "✅" : "❌") << " " << name << std::endl;
        return ok;
    }

    static bool test_haversine_properties() {
        const LatLon points[] = {
            {17.385, 78.4867}, {17.4474, 78.3762}, {-33.8688, 151.2093},
            {51.5074, -0.1278}, {0.0, 0.0}, {89.9, 179.9}
        };

        bool ok = true;
        for (const auto &a : points) {
            ok &= haversine_km(a, a) == 0.0;
            for (const auto &b : points) {
                ok &= haversine_km(a, b) == haversine_km(b, a);
                if (!(a == b)) ok &= haversine_km(a, b) > 0.0;
            }
        }
        return report(ok, "haversine symmetric, zero only on identical points");
    }

    static bool test_haversine_known_distance() {
        double one_degree = haversine_km({0.0, 0.0}, {0.0, 1.0});
        double at_ten = haversine_km({10.0, 10.0}, {10.0, 11.0});

        bool ok = std::abs(one_degree - 111.1949) < 1e-3;
        ok &= std::abs(at_ten - 109.5056) < 1e-3;
        ok &= std::abs(haversine_km({0.0, 0.0}, {0.0, 2.0}) - 2 * one_degree) < 1e-9;
        return report(ok, "haversine known distances");
    }

    static bool test_haversine_antipodal() {
        const double half_circumference = kEarthRadiusKm * std::acos(-1.0);

        bool ok = true;
        for (int i = 0; i < 2000; i++) {
            double lat = -89.95 + i * 0.09;
            double lon = -179.99 + i * 0.18;
            double opposite = lon > 0 ? lon - 180.0 : lon + 180.0;

            double d = haversine_km({lat, lon}, {-lat, opposite});
            ok &= std::isfinite(d) && std::abs(d - half_circumference) < 0.5;
        }
        ok &= std::isfinite(haversine_km({-87.5, -178.74}, {87.5, 1.26}));
        return report(ok, "antipodal points give half the circumference");
    }

    static bool test_round2() {
        bool ok = round2(109.50558) == 109.51;
        ok &= round2(0.0) == 0.0;
        ok &= round2(13.623139) == 13.62;
        ok &= round2(2.005001) == 2.01;
        return report(ok, "round to two decimals");
    }

    static bool test_geocache_from_json() {
        Geocache cache;
        bool ok = cache.loadFromJson(nlohmann::json::parse(
            R"({"Ameerpet": [17.4375, 78.4482], "Kukatpally": [17.4849, 78.4138]})"));

        ok &= cache.size() == 2;
        auto p = cache.lookup("Ameerpet");
        ok &= p.has_value() && p->lat == 17.4375 && p->lon == 78.4482;
        ok &= !cache.lookup("Gachibowli").has_value();
        ok &= !cache.contains("ameerpet");
        return report(ok, "geocache loads [lat, lon] mapping");
    }

    static bool test_geocache_rejects_malformed() {
        Geocache cache;
        cache.loadFromJson(nlohmann::json::parse(R"({"A": [1, 2]})"));

        bool ok = !cache.loadFromJson(nlohmann::json::parse(R"({"B": [1, 2, 3]})"));
        ok &= !cache.loadFromJson(nlohmann::json::parse(R"({"B": ["1", 2]})"));
        ok &= !cache.loadFromJson(nlohmann::json::parse(R"({"B": [91, 0]})"));
        ok &= !cache.loadFromJson(nlohmann::json::parse(R"([[1, 2]])"));
        // rejected documents leave the previous contents in place
        ok &= cache.size() == 1 && cache.contains("A");
        return report(ok, "geocache rejects malformed documents");
    }

    static bool test_geocache_candidate_order() {
        const std::string missing = "/tmp/fieldroute_geo_missing.json";
        const std::string broken = "/tmp/fieldroute_geo_broken.json";
        const std::string first = "/tmp/fieldroute_geo_first.json";
        const std::string second = "/tmp/fieldroute_geo_second.json";

        std::filesystem::remove(missing);
        write_file(broken, "{\"A\": [1, ");
        write_file(first, R"({"A": [10, 10], "B": [10, 11]})");
        write_file(second, R"({"C": [1, 1]})");

        Geocache cache = Geocache::loadFirst({missing, broken, first, second});

        bool ok = cache.size() == 2;
        ok &= cache.contains("A") && cache.contains("B") && !cache.contains("C");
        ok &= cache.source() == first;

        std::filesystem::remove(broken);
        std::filesystem::remove(first);
        std::filesystem::remove(second);
        return report(ok, "first parsable geocache candidate wins");
    }

    static bool test_geocache_all_candidates_fail() {
        const std::string broken = "/tmp/fieldroute_geo_broken2.json";
        write_file(broken, R"({"A": "somewhere"})");

        Geocache cache = Geocache::loadFirst({"/tmp/fieldroute_geo_nowhere.json", broken});
        bool ok = cache.empty() && cache.source().empty();
        ok &= !cache.lookup("A").has_value();

        std::filesystem::remove(broken);
        return report(ok, "no usable candidate leaves an empty geocache");
    }

    static void write_file(const std::string &path, const std::string &content) {
        std::ofstream out(path);
        out << content;
    }
};

int main() {
    return GeoTest::run_all_tests() ? 0 : 1;
}
