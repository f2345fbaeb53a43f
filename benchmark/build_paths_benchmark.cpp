#include "routedoc/core/path_builder.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct benchmark_result {
    std::string name;
    double throughput;
    double latency_p50;
    double latency_p99;
    double latency_p999;
    uint64_t operations;
    uint64_t duration_ms;
    uint64_t errors;
};

void print_result(const benchmark_result& result) {
    std::cout << "\n=== " << result.name << " ===\n";
    std::cout << "Operations: " << result.operations << "\n";
    std::cout << "Duration: " << result.duration_ms << " ms\n";
    std::cout << "Throughput: " << std::fixed << std::setprecision(2) << result.throughput
              << " ops/sec\n";
    std::cout << "Errors: " << result.errors << "\n";
    if (result.latency_p50 > 0.0) {
        std::cout << "Latency p50: " << std::fixed << std::setprecision(3) << result.latency_p50
                  << " us\n";
        std::cout << "Latency p99: " << std::fixed << std::setprecision(3) << result.latency_p99
                  << " us\n";
        std::cout << "Latency p999: " << std::fixed << std::setprecision(3) << result.latency_p999
                  << " us\n";
    }
}

// A service with `resources` collections, each exposing list/get/create/delete.
void populate_service(routedoc::web_service& ws,
                      routedoc::type_registry& types,
                      size_t resources) {
    using namespace routedoc;
    for (size_t i = 0; i < resources; ++i) {
        const std::string name = "Resource" + std::to_string(i);
        const std::string base = "/r" + std::to_string(i);
        auto model = types.composite(name);

        auto& list = ws.add_route(http::method::get, base);
        list.operation = "list" + name;
        list.doc = "List <b>" + name + "</b>";
        list.metadata["openapi.tags"] = std::vector<std::string>{name};
        auto filter = query_parameter("filter", "");
        filter.allow_multiple = true;
        filter.collection = collection_format::multi;
        filter.allowable_values = {{"c", "C"}, {"a", "A"}, {"b", "B"}};
        list.parameter_docs.push_back(filter);
        list.returns(200, "OK", types.array_of(model));

        auto& get = ws.add_route(http::method::get, base + "/{id:[0-9]+}");
        get.operation = "get" + name;
        get.parameter_docs.push_back(path_parameter("id", ""));
        get.returns(200, "OK", types.pointer_to(model)).returns(404, "Not Found");

        auto& create = ws.add_route(http::method::post, base);
        create.operation = "create" + name;
        create.read_sample = model;
        auto body = body_parameter("body", "");
        body.data_type = name;
        create.parameter_docs.push_back(body);
        create.returns(201, "Created", model);

        ws.add_route(http::method::del, base + "/{id:[0-9]+}").operation = "delete" + name;
    }
}

benchmark_result run_build_benchmark(const routedoc::web_service& ws,
                                     const std::string& name,
                                     uint64_t iterations) {
    std::vector<double> latencies;
    latencies.reserve(iterations);

    uint64_t errors = 0;
    routedoc::build_config cfg;
    auto start = std::chrono::steady_clock::now();

    for (uint64_t i = 0; i < iterations; ++i) {
        auto iter_start = std::chrono::steady_clock::now();
        auto result = routedoc::build_paths(ws, cfg);
        auto iter_end = std::chrono::steady_clock::now();

        if (!result) {
            ++errors;
        }

        auto latency_us =
            std::chrono::duration_cast<std::chrono::microseconds>(iter_end - iter_start).count();
        latencies.push_back(static_cast<double>(latency_us));
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::sort(latencies.begin(), latencies.end());

    benchmark_result result;
    result.name = name;
    result.operations = iterations;
    result.errors = errors;
    result.duration_ms = static_cast<uint64_t>(duration_ms);
    result.throughput = static_cast<double>(iterations) /
                        (static_cast<double>(std::max<int64_t>(duration_ms, 1)) / 1000.0);
    result.latency_p50 = latencies[latencies.size() / 2];
    result.latency_p99 = latencies[latencies.size() * 99 / 100];
    result.latency_p999 = latencies[latencies.size() * 999 / 1000];

    return result;
}

int main() {
    std::cout << "build_paths Benchmark\n";
    std::cout << "=====================\n";

    const uint64_t iterations = 10000;

    routedoc::type_registry types;
    routedoc::web_service small;
    populate_service(small, types, 1);
    print_result(run_build_benchmark(small, "Small Service (4 routes)", iterations));

    routedoc::web_service large;
    populate_service(large, types, 50);
    print_result(run_build_benchmark(large, "Large Service (200 routes)", iterations / 10));

    std::cout << "\n";
    return 0;
}
