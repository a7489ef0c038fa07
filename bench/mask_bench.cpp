// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <benchmark/benchmark.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "json_utils.hpp"
#include "masker.hpp"
#include "masking_config.hpp"
#include "object.hpp"

using namespace piiredact;

namespace {

masking_config enabled_config()
{
    masking_config config;
    config.enabled = true;
    return config;
}

owned_object generate_records(std::size_t count)
{
    auto records = owned_object::make_array(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto record = owned_object::make_map(5);
        record.emplace("id", static_cast<uint64_t>(i));
        record.emplace("name", "Record " + std::to_string(i));
        record.emplace("email", "user" + std::to_string(i) + "@example.com");
        record.emplace("notes", "Call +45 12 34 56 78 or write to support@example.dk, "
                                "CPR 010190-1234, card 4111-1111-1111-1111");
        auto &tags = record.emplace("tags", owned_object::make_array(2));
        tags.emplace_back("customer");
        tags.emplace_back("no personal data in this tag at all");
        records.emplace_back(std::move(record));
    }
    return records;
}

void BM_MaskString(benchmark::State &state)
{
    const masker m{enabled_config()};
    const std::string value{"Contact john.doe@example.com or 12345678, CPR 010190-1234, "
                            "card 4111-1111-1111-1111, SSN 123-45-6789"};
    for (auto _ : state) { benchmark::DoNotOptimize(m.mask_string(value)); }
}

void BM_MaskStringNoMatch(benchmark::State &state)
{
    const masker m{enabled_config()};
    const std::string value(static_cast<std::size_t>(state.range(0)), 'a');
    for (auto _ : state) { benchmark::DoNotOptimize(m.mask_string(value)); }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

void BM_MaskRecords(benchmark::State &state)
{
    const masker m{enabled_config()};
    auto records = generate_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) { benchmark::DoNotOptimize(m.mask(records)); }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

void BM_MaskJsonRoundTrip(benchmark::State &state)
{
    const masker m{enabled_config()};
    auto json = object_to_json(generate_records(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        benchmark::DoNotOptimize(object_to_json(m.mask(json_to_object(json))));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * json.size()));
}

} // namespace

BENCHMARK(BM_MaskString);
BENCHMARK(BM_MaskStringNoMatch)->Arg(64)->Arg(4096);
BENCHMARK(BM_MaskRecords)->Arg(1)->Arg(100)->Arg(1000);
BENCHMARK(BM_MaskJsonRoundTrip)->Arg(100);

BENCHMARK_MAIN();
