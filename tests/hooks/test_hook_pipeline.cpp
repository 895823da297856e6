// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

/*
 * test_hook_pipeline.cpp
 *
 * Tests for HookPipeline
 * - Standard pipeline order
 * - Custom hooks, insertion and removal
 * - Base hook effects compose with timestamps
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "atom/error/exception.hpp"
#include "hooks/default_values_hook.hpp"
#include "hooks/hook_pipeline.hpp"
#include "hooks/timestamp_hook.hpp"
#include "model/record.hpp"

using namespace relata;
using namespace relata::hooks;

namespace {

// Appends its name to a shared trace on every call
class TraceHook : public WriteHook {
public:
    TraceHook(std::string name, std::vector<std::string>& trace)
        : name_(std::move(name)), trace_(trace) {}

    [[nodiscard]] std::string_view name() const noexcept override {
        return name_;
    }

    void beforeInsert(model::Record& record,
                      const OperationContext& /*context*/) override {
        trace_.push_back("insert:" + name_);
        record.set("sawCreatedAt", record.createdAt().has_value());
    }

    void beforeUpdate(model::Record& /*record*/,
                      const OperationContext& /*context*/) override {
        trace_.push_back("update:" + name_);
    }

private:
    std::string name_;
    std::vector<std::string>& trace_;
};

}  // namespace

class HookPipelineTest : public ::testing::Test {
protected:
    model::RecordKind person{"Person"};
    std::vector<std::string> trace;
};

TEST_F(HookPipelineTest, StandardOrder) {
    auto pipeline = HookPipeline::standard();
    EXPECT_EQ(pipeline.names(),
              (std::vector<std::string>{"defaults", "timestamps"}));
    EXPECT_EQ(pipeline.size(), 2u);
}

TEST_F(HookPipelineTest, DefaultsAndTimestampsCompose) {
    model::RecordKindOptions options;
    options.defaults = {{"active", true}};
    model::RecordKind member("Member", options);

    model::Record record(member);
    HookPipeline::standard().runBeforeInsert(record, {});

    EXPECT_EQ(record.get("active"), true);
    EXPECT_TRUE(record.createdAt());
    EXPECT_TRUE(record.updatedAt());
}

TEST_F(HookPipelineTest, HooksRunInOrder) {
    HookPipeline pipeline;
    pipeline.append(std::make_shared<TraceHook>("a", trace))
        .append(std::make_shared<TraceHook>("b", trace));

    model::Record record(person);
    pipeline.runBeforeInsert(record, {});
    pipeline.runBeforeUpdate(record, {});

    EXPECT_EQ(trace, (std::vector<std::string>{"insert:a", "insert:b",
                                               "update:a", "update:b"}));
}

TEST_F(HookPipelineTest, InsertBeforeRunsAheadOfTimestamps) {
    auto pipeline = HookPipeline::standard();
    pipeline.insertBefore(TimestampHook::NAME,
                          std::make_shared<TraceHook>("audit", trace));
    EXPECT_EQ(pipeline.names(), (std::vector<std::string>{
                                    "defaults", "audit", "timestamps"}));

    model::Record record(person);
    pipeline.runBeforeInsert(record, {});
    EXPECT_EQ(record.get("sawCreatedAt"), false);
    EXPECT_TRUE(record.createdAt());
}

TEST_F(HookPipelineTest, RemoveHook) {
    auto pipeline = HookPipeline::standard();
    EXPECT_TRUE(pipeline.remove(TimestampHook::NAME));
    EXPECT_FALSE(pipeline.remove(TimestampHook::NAME));

    model::Record record(person);
    pipeline.runBeforeInsert(record, {});
    EXPECT_FALSE(record.createdAt());
}

TEST_F(HookPipelineTest, InvalidInsertionsFail) {
    auto pipeline = HookPipeline::standard();
    EXPECT_THROW(pipeline.append(nullptr), atom::error::InvalidArgument);
    EXPECT_THROW(pipeline.append(std::make_shared<DefaultValuesHook>()),
                 atom::error::InvalidArgument);
    EXPECT_THROW(pipeline.insertBefore(
                     "missing", std::make_shared<TraceHook>("x", trace)),
                 atom::error::InvalidArgument);
    EXPECT_EQ(pipeline.size(), 2u);
}
