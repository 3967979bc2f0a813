#include <string>
#include <catch2/catch.hpp>
#include <qx/status_codes.hpp>

using namespace std::string_literals;

enum class lock_code
{
    busy = 1,
    poisoned = 2,
    other = 3
};

enum class queue_code
{
    busy = 1,
    full = 2,
    other = 3
};

class lock_category : public qx::status_category
{
    constexpr static uint64_t id = 0x5d0c9a3e7b214f68;

public:
    lock_category()
        : qx::status_category(id)
    {}

    const char* name() const noexcept override
    {
        return "lock";
    }

    const char* message(int status) const noexcept override
    {
        switch (static_cast<lock_code>(status))
        {
        case lock_code::busy:
            return "busy";
        case lock_code::poisoned:
            return "poisoned";
        case lock_code::other:
            return "other";
        }
        QX_CHECK(false);
        return "undefined";
    }
};

class queue_category : public qx::status_category
{
    constexpr static uint64_t id = 0xa4f1e07c3b96d255;

public:
    queue_category()
        : qx::status_category(id)
    {}

    const char* name() const noexcept override
    {
        return "queue";
    }

    const char* message(int status) const noexcept override
    {
        switch (static_cast<queue_code>(status))
        {
        case queue_code::busy:
            return "queue busy";
        case queue_code::full:
            return "queue full";
        case queue_code::other:
            return "queue other";
        }
        QX_CHECK(false);
        return "undefined";
    }
};

inline qx::status_code make_status_code(lock_code e)
{
    const static lock_category global_lock_category;
    return qx::status_code{ e, &global_lock_category };
}

inline qx::status_code make_status_code(queue_code e)
{
    const static queue_category global_queue_category;
    return qx::status_code{ e, &global_queue_category };
}

TEST_CASE("status category", "[core]")
{
    qx::status_code busy = lock_code::busy;
    qx::status_code busy2 = lock_code::busy;
    qx::status_code poisoned = lock_code::poisoned;
    qx::status_code queue_busy = queue_code::busy;

    // same value, different categories
    REQUIRE(busy == busy2);
    REQUIRE(busy != poisoned);
    REQUIRE(busy != queue_busy);
    REQUIRE(poisoned != queue_busy);

    REQUIRE(busy == lock_code::busy);
    REQUIRE(busy != lock_code::poisoned);
    REQUIRE(busy != queue_code::busy);
    REQUIRE(busy.message() == "busy"s);
    REQUIRE(busy.category_name() == "lock"s);

    REQUIRE(queue_busy == queue_code::busy);
    REQUIRE(queue_busy != queue_code::full);
    REQUIRE(queue_busy != lock_code::busy);
    REQUIRE(queue_busy.message() == "queue busy"s);
    REQUIRE(queue_busy.category_name() == "queue"s);
}

TEST_CASE("qx status codes", "[core]")
{
    REQUIRE(qx::cancel != qx::pending);
    REQUIRE(qx::pending != qx::abandoned);
    REQUIRE(qx::abandoned != qx::other);

    REQUIRE(qx::abandoned.category_name() == "qx"s);
    REQUIRE(qx::abandoned.message() == "abandoned"s);
    REQUIRE(qx::pending.message() == "pending"s);
    REQUIRE(qx::cancel.message() == "cancel"s);

    qx::status_code busy = lock_code::busy;
    REQUIRE(busy.code() == 1);
    REQUIRE(qx::cancel.code() == 1);
    REQUIRE(busy != qx::cancel);
}
