/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file handler_test.cpp
 * @brief Integration tests for the diagnostic request handler.
 *
 * @details
 * Requests go through `Handler::process` exactly as the `edit` command feeds
 * them from stdin; responses are parsed back with cJSON.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "lyra/diag/handler.hpp"
#include "lyra/diag/line_reader.hpp"
#include "lyra/session/config.hpp"
#include "lyra/session/editor_session.hpp"

#include <cJSON.h>
#include <string>
#include <unistd.h>
#include <vector>

using lyra::diag::Context;
using lyra::diag::Handler;
using lyra::diag::LineReader;
using lyra::session::Config;
using lyra::session::DocumentRef;
using lyra::session::EditorSession;

namespace {

/// @brief Parsed response; owns the cJSON tree.
class Response {
  public:
    explicit Response(const std::string& raw) : root_(cJSON_Parse(raw.c_str())) {}
    ~Response() { cJSON_Delete(root_); }

    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    bool valid() const { return root_ != nullptr; }

    std::string text(const char* name) const
    {
        cJSON* item = cJSON_GetObjectItem(root_, name);
        return cJSON_IsString(item) ? item->valuestring : "";
    }

    cJSON* item(const char* name) const { return cJSON_GetObjectItem(root_, name); }

  private:
    cJSON* root_;
};

} // namespace

void test_handle_stats()
{
    lyra::test::Rig rig(4096, 8192);
    ASSERT_TRUE(rig.store->write_draft(lyra::storage::Tier::DURABLE, "song", "[C]la la").ok());

    Context ctx{*rig.store};
    Response resp(Handler::process(ctx, R"({"action":"stats"})"));
    ASSERT_TRUE(resp.valid());
    ASSERT_EQ(resp.text("status"), std::string("ok"));

    cJSON* durable = cJSON_GetObjectItem(resp.item("data"), "durable");
    ASSERT_EQ(cJSON_GetObjectItem(durable, "capacity")->valueint, 8192);
    ASSERT_EQ(cJSON_GetObjectItem(durable, "drafts")->valueint, 1);
}

/**
 * @brief Malformed and empty payloads yield a structured error, never a crash.
 */
void test_handle_invalid_json()
{
    lyra::test::Rig rig;
    Context ctx{*rig.store};

    Response bad(Handler::process(ctx, "{ action : \"insert\", offset : ... "));
    ASSERT_TRUE(bad.valid());
    ASSERT_EQ(bad.text("status"), std::string("error"));
    ASSERT_EQ(bad.text("message"), std::string("Invalid JSON syntax"));

    Response empty(Handler::process(ctx, ""));
    ASSERT_EQ(empty.text("status"), std::string("error"));
}

void test_handle_unknown_action()
{
    lyra::test::Rig rig;
    Context ctx{*rig.store};

    Response resp(Handler::process(ctx, R"({"action":"defragment"})"));
    ASSERT_EQ(resp.text("status"), std::string("error"));
    ASSERT_EQ(resp.text("code"), std::string("INVALID_ARGUMENT"));
}

void test_handle_session_action_without_session()
{
    lyra::test::Rig rig;
    Context ctx{*rig.store};

    Response resp(Handler::process(ctx, R"({"action":"undo"})"));
    ASSERT_EQ(resp.text("status"), std::string("error"));
    ASSERT_TRUE(resp.text("message").find("No open document") != std::string::npos);
}

/**
 * @brief Edit, inspect and undo through the request surface.
 */
void test_handle_edit_round_trip()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();
    Context ctx{*rig.store, &session};

    Response inserted(
        Handler::process(ctx, R"({"action":"insert","offset":0,"text":"[G]Let it be"})"));
    ASSERT_EQ(inserted.text("status"), std::string("ok"));

    Response replaced(Handler::process(
        ctx, R"({"action":"replace","offset":3,"length":9,"text":"Yesterday"})"));
    ASSERT_EQ(replaced.text("status"), std::string("ok"));

    Response content(Handler::process(ctx, R"({"action":"content"})"));
    ASSERT_EQ(content.text("content"), std::string("[G]Yesterday"));

    Response undone(Handler::process(ctx, R"({"action":"undo"})"));
    ASSERT_TRUE(cJSON_IsTrue(undone.item("applied")));
    ASSERT_TRUE(cJSON_IsTrue(undone.item("canContinue")));
    ASSERT_EQ(session.content(), std::string("[G]Let it be"));

    Response bad_range(Handler::process(ctx, R"({"action":"delete","offset":50,"length":1})"));
    ASSERT_EQ(bad_range.text("code"), std::string("INVALID_ARGUMENT"));

    Response missing(Handler::process(ctx, R"({"action":"insert","offset":0})"));
    ASSERT_EQ(missing.text("status"), std::string("error"));

    Response huge(Handler::process(ctx, R"({"action":"insert","offset":1e300,"text":"x"})"));
    ASSERT_EQ(huge.text("status"), std::string("error"));
    Response negative(
        Handler::process(ctx, R"({"action":"delete","offset":-1,"length":1})"));
    ASSERT_EQ(negative.text("status"), std::string("error"));
    ASSERT_EQ(session.content(), std::string("[G]Let it be"));
}

void test_handle_save_reports_state()
{
    lyra::test::Rig rig;
    EditorSession session(DocumentRef{"song", false}, rig.loop, *rig.store, Config{});
    session.open();
    Context ctx{*rig.store, &session};

    ASSERT_TRUE(session.insert(0, "Hey Jude").ok());
    Response saved(Handler::process(ctx, R"({"action":"save"})"));
    ASSERT_EQ(saved.text("status"), std::string("ok"));

    cJSON* save = cJSON_GetObjectItem(saved.item("data"), "save");
    ASSERT_EQ(std::string(cJSON_GetObjectItem(save, "status")->valuestring), std::string("saved"));
    ASSERT_FALSE(cJSON_IsTrue(cJSON_GetObjectItem(save, "isDirty")));

    Response history(Handler::process(ctx, R"({"action":"history"})"));
    ASSERT_EQ(cJSON_GetObjectItem(history.item("data"), "length")->valueint, 1);

    Response drafts(Handler::process(ctx, R"({"action":"drafts"})"));
    ASSERT_EQ(cJSON_GetArraySize(drafts.item("data")), 2);
}

/**
 * @brief Request lines are split without blocking; EOF ends the input.
 */
void test_line_reader_splits_without_blocking()
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    LineReader reader(fds[0]);

    // Nothing written yet: returns immediately with no lines.
    std::vector<std::string> lines;
    ASSERT_TRUE(reader.drain(lines));
    ASSERT_TRUE(lines.empty());

    const std::string first = "{\"action\":\"exit\"}\n{\"action\":\"con";
    ASSERT_EQ(::write(fds[1], first.data(), first.size()), static_cast<ssize_t>(first.size()));
    ASSERT_TRUE(reader.drain(lines));
    ASSERT_EQ(lines.size(), static_cast<size_t>(1));
    ASSERT_EQ(lines[0], std::string("{\"action\":\"exit\"}"));

    const std::string rest = "tent\"}\n{\"action\":\"stats\"}";
    ASSERT_EQ(::write(fds[1], rest.data(), rest.size()), static_cast<ssize_t>(rest.size()));
    ::close(fds[1]);

    lines.clear();
    ASSERT_FALSE(reader.drain(lines));
    ASSERT_EQ(lines.size(), static_cast<size_t>(2));
    ASSERT_EQ(lines[0], std::string("{\"action\":\"content\"}"));
    ASSERT_EQ(lines[1], std::string("{\"action\":\"stats\"}"));
    ::close(fds[0]);
}
