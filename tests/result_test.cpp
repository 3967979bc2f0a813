#include <memory>
#include <string>
#include <string_view>
#include <catch2/catch.hpp>
#include <qx/qx.hpp>

class no_copy_no_move
{
public:
    no_copy_no_move(int i)
        : i(i)
    {}

    no_copy_no_move(const no_copy_no_move&) = delete;
    no_copy_no_move(no_copy_no_move&&) = delete;

    no_copy_no_move& operator=(const no_copy_no_move&) = delete;
    no_copy_no_move& operator=(no_copy_no_move&&) = delete;

private:
    int i = 0;
};

class only_move
{
public:
    only_move(int i)
        : i(i)
    {}

    only_move(const only_move&) = delete;
    only_move(only_move&&) = default;

    only_move& operator=(const only_move&) = delete;
    only_move& operator=(only_move&&) = default;

private:
    int i = 0;
};

TEMPLATE_TEST_CASE("result construction", "[core]", int, no_copy_no_move, only_move)
{
    SECTION("Create with qx::err")
    {
        qx::result<TestType> res = qx::err(qx::cancel);
        REQUIRE_THROWS_AS(res.unwrap(), qx::exception);
        REQUIRE_NOTHROW(res.err());
    }

    SECTION("Create with qx::ok")
    {
        qx::result<TestType> res = qx::ok(10);
        REQUIRE_NOTHROW(res.unwrap());
        REQUIRE_THROWS(res.err());
    }
}

TEST_CASE("result args construction", "[core]")
{
    const std::string msg = "my message";
    qx::result<std::string_view> res = qx::ok(msg);
    REQUIRE(res.unwrap() == "my message");
}

TEST_CASE("result unwrap move only", "[core]")
{
    qx::result<std::unique_ptr<int>> res = qx::ok(std::make_unique<int>(10));

    SECTION("move unwrapped")
    {
        auto ptr = std::move(res.unwrap());
        REQUIRE(ptr != nullptr);
        REQUIRE(*ptr == 10);
    }

    SECTION("unwrap moved")
    {
        auto ptr = std::move(res).unwrap();
        REQUIRE(ptr != nullptr);
        REQUIRE(*ptr == 10);
    }
}

TEST_CASE("result void", "[core]")
{
    qx::result<void> res = qx::ok();
    REQUIRE_NOTHROW(res.unwrap());
    res = qx::err(qx::abandoned);
    REQUIRE_THROWS_AS(res.unwrap(), qx::exception);
}

TEST_CASE("result comparison", "[core]")
{
    qx::result<int> res = qx::err(qx::pending);
    REQUIRE(res.is_err() == true);
    REQUIRE(res.is_ok() == false);
    REQUIRE(res.err() == qx::pending);
    REQUIRE(res == qx::pending);
    REQUIRE(res != qx::cancel);

    qx::result<int> ok_res = qx::ok(1);
    REQUIRE(ok_res != qx::pending);
}

TEST_CASE("result error_desc", "[core]")
{
    const char* msg = "my favorite error";
    qx::result<int> res = qx::err(qx::abandoned, msg);
    REQUIRE(res.is_err() == true);
    REQUIRE(res.what() == msg);
    REQUIRE(res.err() == qx::error_desc(qx::abandoned, msg));
    REQUIRE(res.err() == qx::error_desc(qx::abandoned));
    REQUIRE(res.err() != qx::error_desc(qx::cancel, msg));
    REQUIRE(res.err() != qx::error_desc(qx::cancel));
}

TEST_CASE("exception carries the error", "[core]")
{
    qx::result<int> res = qx::err(qx::cancel, "request discarded");
    try
    {
        res.unwrap();
        FAIL("unwrap of an error has to throw");
    }
    catch (const qx::exception& exc)
    {
        REQUIRE(exc.status() == qx::cancel);
        REQUIRE(std::string(exc.what()) == "request discarded");
    }
}
