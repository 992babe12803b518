#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "config.hpp"
#include "dispatch.hpp"
#include "geocache.hpp"
#include "render.hpp"

using namespace std;
using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc != 4) {
        cerr << "Usage: " << argv[0] << " <config.json> <queries.json> <output.json>\n";
        return 1;
    }

    EngineConfig config;
    if (!load_config(argv[1], config)) {
        cerr << "Failed to load config from " << argv[1] << "\n";
        return 1;
    }

    Geocache geocache = Geocache::loadFirst(config.geocache_paths);
    if (geocache.empty()) {
        cerr << "No geocache loaded, every route will come back empty\n";
    } else {
        cout << "Loaded geocache with " << geocache.size() << " locations from "
             << geocache.source() << "\n";
    }

    ifstream f(argv[2]);
    if (!f) {
        cerr << "Failed to open queries file " << argv[2] << "\n";
        return 1;
    }

    json q;
    try {
        f >> q;
    } catch (const exception& e) {
        cerr << "Error parsing queries JSON: " << e.what() << "\n";
        return 1;
    }
    f.close();

    if (!q.contains("events") || !q["events"].is_array()) {
        cerr << "No events found in queries\n";
        return 1;
    }

    SvgRouteRenderer renderer;
    Dispatcher dispatcher(config, geocache, renderer);

    vector<json> results;
    int failed = 0;
    auto batch_start = chrono::high_resolution_clock::now();

    for (const auto& query : q["events"]) {
        auto start_time = chrono::high_resolution_clock::now();

        json result = dispatcher.process_query(query);

        auto end_time = chrono::high_resolution_clock::now();
        result["processing_time"] = chrono::duration<double, milli>(end_time - start_time).count();
        if (result.contains("error")) failed++;
        results.push_back(result);
    }

    auto batch_end = chrono::high_resolution_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(batch_end - batch_start);
    cout << "Processed " << results.size() << " queries (" << failed << " with errors) in "
         << duration.count() << " ms\n";

    json out;
    out["meta"] = q.contains("meta") ? q["meta"] : json::object();
    out["results"] = results;

    ofstream out_file(argv[3]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[3] << "\n";
        return 1;
    }

    out_file << out.dump(2) << endl;
    out_file.close();

    cout << "Output written to " << argv[3] << "\n";
    return 0;
}
