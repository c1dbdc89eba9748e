// ---------------------------------------------------------------------------
// application_test.cpp
//
// The stdin/stdout service loop: every non-blank input line gets exactly
// one response line, answered before run() returns.
// ---------------------------------------------------------------------------

#include <sqlgate/core/application.hpp>
#include <sqlgate/core/json.hpp>

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <unistd.h>

using sqlgate::Application;
using sqlgate::Json;
using sqlgate::SandboxInstance;

namespace {

std::string write_temp_config(const std::string& body) {
    char path[] = "/tmp/sqlgate-test-XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) return "";
    close(fd);

    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

// ---------------------------------------------------------------------------
// Bounded line reader
// ---------------------------------------------------------------------------

TEST(Application, ReadLineSplitsOnNewline) {
    std::istringstream in("first\n\nlast");
    std::string line;
    bool overflow = true;

    ASSERT_TRUE(Application::read_line(in, 64, line, overflow));
    EXPECT_EQ(line, "first");
    EXPECT_FALSE(overflow);
    ASSERT_TRUE(Application::read_line(in, 64, line, overflow));
    EXPECT_EQ(line, "");
    ASSERT_TRUE(Application::read_line(in, 64, line, overflow));
    EXPECT_EQ(line, "last");
    EXPECT_FALSE(Application::read_line(in, 64, line, overflow));
}

TEST(Application, ReadLineDropsTailOfLongLine) {
    std::istringstream in(std::string(10000, 'a') + "\nnext\n");
    std::string line;
    bool overflow = false;

    ASSERT_TRUE(Application::read_line(in, 16, line, overflow));
    EXPECT_TRUE(overflow);
    EXPECT_EQ(line.size(), 16u);

    ASSERT_TRUE(Application::read_line(in, 16, line, overflow));
    EXPECT_FALSE(overflow);
    EXPECT_EQ(line, "next");
}

TEST(Application, ReadLineAtLimitIsNotOverflow) {
    std::istringstream in(std::string(16, 'b') + "\n");
    std::string line;
    bool overflow = true;
    ASSERT_TRUE(Application::read_line(in, 16, line, overflow));
    EXPECT_FALSE(overflow);
    EXPECT_EQ(line, std::string(16, 'b'));
}

// ---------------------------------------------------------------------------
// Serving loop
// ---------------------------------------------------------------------------

// The application is a process-wide singleton, so this is the only test
// that initializes it.
TEST(Application, ServesEveryLineThenDrains) {
    const std::string config_path = write_temp_config(R"({
        "log_level": "error",
        "server": { "workers": 3, "max_pending": 1, "max_line_bytes": 1024 },
        "validator": { "max_rows": 2, "timeout_ms": 500 },
        "jail": { "enabled": false }
    })");
    ASSERT_FALSE(config_path.empty());

    std::string prog = "sqlgate";
    std::string flag = "--config";
    char* argv[] = { &prog[0], &flag[0], const_cast<char*>(config_path.c_str()), nullptr };
    Application& app = Application::instance();
    ASSERT_TRUE(app.init(3, argv));
    std::remove(config_path.c_str());

    std::istringstream in(
        "{\"id\":1,\"sql\":\"SELECT x FROM t ORDER BY x\",\"seed_sql\":\"CREATE TABLE t(x INT); INSERT INTO t VALUES (1),(2),(3);\"}\n"
        "\n"
        "{\"id\":2,\"sql\":\"DROP TABLE t\"}\n"
        "{\"id\":3,\"type\":\"ping\"}\n"
        "garbage\n"
        "{\"id\":4,\"sql\":\"SELECT '" + std::string(5000, 'x') + "'\"}\n"
        "{\"id\":5,\"sql\":\"WITH RECURSIVE c(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM c) SELECT count(*) FROM c\"}\n");
    std::ostringstream out;

    EXPECT_EQ(app.run(in, out), 0);

    std::map<int, Json> by_id;
    int without_id = 0;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        Json response = Json::parse(line);
        if (response.contains("id")) {
            by_id[response["id"].get<int>()] = response;
        } else {
            ++without_id;
        }
    }

    // The over-long line is answered without being parsed, so no id
    ASSERT_EQ(by_id.size(), 4u);
    EXPECT_EQ(without_id, 2);
    EXPECT_EQ(by_id.count(4), 0u);
    EXPECT_NE(out.str().find("line exceeds 1024 bytes"), std::string::npos);

    EXPECT_EQ(by_id[1]["verdict"], "ok");
    EXPECT_EQ(by_id[1]["rows"], Json::parse("[[1],[2]]"));
    EXPECT_EQ(by_id[1]["truncated"], true);

    EXPECT_EQ(by_id[2]["message"], "forbidden keywords");
    EXPECT_EQ(by_id[3]["type"], "pong");

    EXPECT_EQ(by_id[5]["verdict"], "error");
    EXPECT_NE(by_id[5]["message"].get<std::string>().find("timed out"), std::string::npos);

    app.shutdown();
    EXPECT_EQ(SandboxInstance::live_count(), 0);
}
