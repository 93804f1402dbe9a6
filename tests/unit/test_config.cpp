#include <catch2/catch.hpp>
#include "base/config.hpp"
#include "temp_config_file.hpp"

using namespace finder;

// Config 是单例，每次 load 会清空之前的数据

TEST_CASE("Config load valid file", "[config]") {
    TempConfigFile file(
        "[ui]\n"
        "input_position = bottom\n"
        "channel = files\n"
        "\n"
        "[theme]\n"
        "border = red\n"
    );

    REQUIRE(Config::instance().load(file.path()));

    REQUIRE(Config::instance().get("ui", "input_position") == "bottom");
    REQUIRE(Config::instance().get("ui", "channel") == "files");
    REQUIRE(Config::instance().get("theme", "border") == "red");
}

TEST_CASE("Config get with default value", "[config]") {
    TempConfigFile file("[ui]\nprompt = >>\n");
    Config::instance().load(file.path());

    REQUIRE(Config::instance().get("ui", "prompt", "default") == ">>");
    REQUIRE(Config::instance().get("ui", "nonexistent", "default") == "default");
    REQUIRE(Config::instance().get("nosection", "prompt", "default") == "default");
}

TEST_CASE("Config find distinguishes missing from empty", "[config]") {
    TempConfigFile file(
        "[ui]\n"
        "results_header =\n"
        "preview_header = \"\"\n"
        "input_header = \"  Query  \"\n"
    );
    Config::instance().load(file.path());

    REQUIRE_FALSE(Config::instance().find("ui", "missing").has_value());
    REQUIRE(Config::instance().find("ui", "results_header") == std::optional<std::string>(""));
    REQUIRE(Config::instance().find("ui", "preview_header") == std::optional<std::string>(""));
    // 引号保留首尾空格
    REQUIRE(Config::instance().find("ui", "input_header") == std::optional<std::string>("  Query  "));
}

TEST_CASE("Config get_int", "[config]") {
    TempConfigFile file(
        "[numbers]\n"
        "positive = 42\n"
        "negative = -10\n"
        "zero = 0\n"
        "invalid = abc\n"
    );
    Config::instance().load(file.path());

    REQUIRE(Config::instance().get_int("numbers", "positive", 0) == 42);
    REQUIRE(Config::instance().get_int("numbers", "negative", 0) == -10);
    REQUIRE(Config::instance().get_int("numbers", "zero", 99) == 0);

    // 无效值、不存在的 key 返回默认值
    REQUIRE(Config::instance().get_int("numbers", "invalid", 99) == 99);
    REQUIRE(Config::instance().get_int("numbers", "missing", 123) == 123);
}

TEST_CASE("Config get_bool", "[config]") {
    TempConfigFile file(
        "[flags]\n"
        "a = true\n"
        "b = Yes\n"
        "c = on\n"
        "d = 0\n"
        "e = OFF\n"
        "f = maybe\n"
    );
    Config::instance().load(file.path());

    REQUIRE(Config::instance().get_bool("flags", "a"));
    REQUIRE(Config::instance().get_bool("flags", "b"));
    REQUIRE(Config::instance().get_bool("flags", "c"));
    REQUIRE_FALSE(Config::instance().get_bool("flags", "d", true));
    REQUIRE_FALSE(Config::instance().get_bool("flags", "e", true));

    // 无法识别、不存在时返回默认值
    REQUIRE(Config::instance().get_bool("flags", "f", true));
    REQUIRE_FALSE(Config::instance().get_bool("flags", "missing", false));
}

TEST_CASE("Config handles comments and whitespace", "[config]") {
    TempConfigFile file(
        "; comment\n"
        "# also a comment\n"
        "[ section ]\n"
        "  key1  =  value1  \n"
        "key2=value2\n"
    );
    Config::instance().load(file.path());

    REQUIRE(Config::instance().get("section", "key1") == "value1");
    REQUIRE(Config::instance().get("section", "key2") == "value2");
}

TEST_CASE("Config handles empty file and clear", "[config]") {
    TempConfigFile file("[ui]\nchannel = x\n");
    REQUIRE(Config::instance().load(file.path()));
    Config::instance().clear();
    REQUIRE(Config::instance().get("ui", "channel", "default") == "default");

    TempConfigFile empty("");
    REQUIRE(Config::instance().load(empty.path()));
    REQUIRE(Config::instance().get("any", "key", "default") == "default");
}

TEST_CASE("Config load nonexistent file", "[config]") {
    REQUIRE_FALSE(Config::instance().load("/nonexistent/path/config.ini"));
}
