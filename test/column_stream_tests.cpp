//
// Created by Jesson on 2026/10/18.
//

#include <pgwire/column_stream.h>
#include <pgwire/connector.h>
#include <pgwire/detail/sync_wait.h>
#include <pgwire/errors.h>
#include <pgwire/operation_cancelled.h>
#include <pgwire/cancellation/cancellation_source.h>

#include "test_support.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <vector>

#include "doctest/doctest.h"

using pgwire::test::bytes;
using pgwire::test::concat;
using pgwire::test::make_connection;
using pgwire::test::sequence;

namespace {

auto read_all(pgwire::column_stream& s, std::size_t chunk = 64) -> std::vector<std::byte> {
    std::vector<std::byte> result;
    std::vector<std::byte> buffer(chunk);
    while (const auto n = s.read(buffer)) {
        result.insert(result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return result;
}

}

TEST_SUITE_BEGIN("column_stream");

TEST_CASE("a stream that was never initialized is disposed") {
    auto [source, conn] = make_connection(sequence(4));
    pgwire::column_stream s{ *conn };
    std::array<std::byte, 4> buffer{};

    CHECK(s.is_disposed());
    CHECK_THROWS_AS((void)s.length(), const pgwire::object_disposed&);
    CHECK_THROWS_AS((void)s.position(), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.set_position(0), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.seek(0, pgwire::seek_origin::begin), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.read(buffer), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.read_byte(), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.read_async(buffer), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.flush(), const pgwire::object_disposed&);
    CHECK_THROWS_AS(s.flush_async(), const pgwire::object_disposed&);
    CHECK(source->read_calls() == 0);
}

TEST_CASE("init rejects a negative length") {
    auto [source, conn] = make_connection(sequence(4));
    pgwire::column_stream s{ *conn };

    CHECK_THROWS_AS(s.init(-1, false), const std::invalid_argument&);
    CHECK(s.is_disposed());
}

TEST_CASE("capabilities") {
    auto [source, conn] = make_connection(sequence(8));

    auto& sequential = conn->open_column_stream(4, false);
    CHECK(sequential.can_read());
    CHECK(!sequential.can_write());
    CHECK(!sequential.can_seek());
    CHECK(sequential.length() == 4);
    CHECK(sequential.position() == 0);

    auto& seekable = conn->open_column_stream(4, true);
    CHECK(seekable.can_seek());
    CHECK(seekable.length() == 4);
}

TEST_CASE("writing and resizing are not supported") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(4, false);
    const auto data = bytes({ 1, 2 });

    CHECK_THROWS_AS(s.write(data), const pgwire::not_supported&);
    CHECK_THROWS_AS(s.set_length(2), const pgwire::not_supported&);
    CHECK(s.length() == 4);
}

TEST_CASE("reads are bounded by the column length") {
    auto [source, conn] = make_connection(sequence(20));
    auto& s = conn->open_column_stream(10, false);

    std::array<std::byte, 3> three{};
    std::array<std::byte, 4> four{};
    std::array<std::byte, 5> five{};

    CHECK(s.read(three) == 3);
    CHECK(s.position() == 3);
    CHECK(s.read(four) == 4);
    CHECK(s.position() == 7);
    CHECK(s.read(five) == 3);
    CHECK(s.position() == 10);
    CHECK(five[0] == std::byte{ 7 });
    CHECK(five[2] == std::byte{ 9 });

    CHECK(s.read(five) == 0);
    CHECK(s.read_byte() == -1);
    CHECK(s.position() == 10);
    CHECK(conn->read_buffer().read_position() == 10);
}

TEST_CASE("short reads never cross the end of the column") {
    auto [source, conn] = make_connection(concat(sequence(7), bytes({ 0xee, 0xee })), 8192, 2);
    auto& s = conn->open_column_stream(7, false);

    std::array<std::byte, 16> buffer{};
    std::size_t total = 0;
    while (const auto n = s.read(buffer)) {
        CHECK(n <= 2);
        total += n;
        CHECK(s.position() == static_cast<std::int64_t>(total));
    }

    CHECK(total == 7);
    CHECK(conn->read_buffer().cumulative_read_position() == 7);
}

TEST_CASE("reading nothing does not touch the buffer") {
    auto [source, conn] = make_connection(sequence(8));
    pgwire::test::recording_read_buffer recorder{ conn->read_buffer() };
    pgwire::column_stream s{ *conn, recorder };
    std::array<std::byte, 4> buffer{};

    s.init(0, false);
    CHECK(s.read(buffer) == 0);
    CHECK(pgwire::sync_wait(s.read_async(buffer)) == 0);
    CHECK(s.read(std::span<std::byte>{}) == 0);

    CHECK(recorder.read_calls == 0);
    CHECK(recorder.read_async_calls == 0);

    s.dispose();
    CHECK(recorder.skips.empty());
}

TEST_CASE("read_byte") {
    auto [source, conn] = make_connection(bytes({ 0x00, 0x7f, 0xff, 0x10 }));
    auto& s = conn->open_column_stream(3, false);

    CHECK(s.read_byte() == 0x00);
    CHECK(s.read_byte() == 0x7f);
    CHECK(s.read_byte() == 0xff);
    CHECK(s.read_byte() == -1);
    CHECK(s.position() == 3);
}

TEST_CASE("region reads validate their arguments") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(5, false);
    std::array<std::byte, 4> buffer{};

    CHECK_THROWS_AS(s.read(nullptr, 0, 0, 0), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read(buffer.data(), buffer.size(), -1, 1), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read(buffer.data(), buffer.size(), 0, -1), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read_async(buffer.data(), buffer.size(), -1, 1), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read(buffer.data(), buffer.size(), 2, 3), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read(buffer.data(), buffer.size(), 5, 0), const std::invalid_argument&);
    CHECK_THROWS_AS(s.read_async(buffer.data(), buffer.size(), 3, 2), const std::invalid_argument&);
    CHECK(s.position() == 0);

    CHECK(s.read(buffer.data(), buffer.size(), 1, 3) == 3);
    CHECK(buffer[0] == std::byte{ 0 });
    CHECK(buffer[1] == std::byte{ 0 });
    CHECK(buffer[2] == std::byte{ 1 });
    CHECK(buffer[3] == std::byte{ 2 });

    CHECK(pgwire::sync_wait(s.read_async(buffer.data(), buffer.size(), 0, 4)) == 2);
    CHECK(buffer[0] == std::byte{ 3 });
    CHECK(buffer[1] == std::byte{ 4 });
    CHECK(s.position() == 5);
}

TEST_CASE("dispose skips the unread rest exactly once") {
    auto [source, conn] = make_connection(sequence(12));
    pgwire::test::recording_read_buffer recorder{ conn->read_buffer() };
    pgwire::column_stream s{ *conn, recorder };
    std::array<std::byte, 2> buffer{};

    s.init(5, false);
    CHECK(s.read(buffer) == 2);
    s.dispose();

    REQUIRE(recorder.skips.size() == 1);
    CHECK(recorder.skips[0] == 3);
    CHECK(s.is_disposed());
    CHECK(recorder.read_position() == 5);

    s.dispose();
    CHECK(recorder.skips.size() == 1);

    s.init(4, false);
    CHECK(s.read_byte() == 5);
}

TEST_CASE("disposing an unread column skips all of it") {
    auto [source, conn] = make_connection(concat(sequence(5), bytes({ 60, 61 })));
    pgwire::test::recording_read_buffer recorder{ conn->read_buffer() };
    pgwire::column_stream s{ *conn, recorder };

    const auto start = recorder.read_position();
    s.init(5, false);
    s.dispose();

    CHECK(recorder.skips == std::vector<std::int32_t>{ 5 });
    CHECK(recorder.read_calls == 0);

    s.init(2, false);
    CHECK(recorder.read_position() == start + 5);
    CHECK(s.read_byte() == 60);
}

TEST_CASE("the next column starts where the previous one ends, however much of it was read") {
    const auto data = concat(sequence(10), bytes({ 200, 201, 202, 203, 204 }));

    for (const int consumed : { 0, 1, 3, 7, 10 }) {
        CAPTURE(consumed);
        // A tiny buffer and chunked delivery force refills inside the skip.
        auto [source, conn] = make_connection(data, 4, 3);

        auto& first = conn->open_column_stream(10, false);
        for (int i = 0; i < consumed; ++i) {
            CHECK(first.read_byte() == i);
        }
        first.dispose();
        CHECK(conn->read_buffer().cumulative_read_position() == 10);

        auto& second = conn->open_column_stream(5, false);
        const auto rest = read_all(second, 2);
        CHECK(rest == bytes({ 200, 201, 202, 203, 204 }));
    }
}

TEST_CASE("dispose_async resynchronizes the buffer") {
    auto [source, conn] = make_connection(concat(sequence(10), bytes({ 42 })), 4, 3);
    auto& s = conn->open_column_stream(10, false);

    std::array<std::byte, 2> buffer{};
    CHECK(pgwire::sync_wait(s.read_async(buffer)) == 2);

    pgwire::sync_wait(s.dispose_async());
    CHECK(s.is_disposed());
    CHECK(conn->read_buffer().cumulative_read_position() == 10);

    auto& next = conn->open_column_stream(1, false);
    CHECK(next.read_byte() == 42);
}

TEST_CASE("a failed skip leaves the stream active") {
    auto [source, conn] = make_connection(sequence(3));
    auto& s = conn->open_column_stream(10, false);

    CHECK(s.read_byte() == 0);
    CHECK_THROWS_AS(s.dispose(), const pgwire::end_of_stream&);
    CHECK(!s.is_disposed());
    CHECK_THROWS_AS(pgwire::sync_wait(s.dispose_async()), const pgwire::end_of_stream&);
    CHECK(!s.is_disposed());
}

TEST_CASE("sequential streams can't seek") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(4, false);

    CHECK_THROWS_AS(s.seek(0, pgwire::seek_origin::begin), const pgwire::not_supported&);
    CHECK_THROWS_AS(s.seek(0, pgwire::seek_origin::current), const pgwire::not_supported&);
    CHECK_THROWS_AS(s.seek(0, pgwire::seek_origin::end), const pgwire::not_supported&);
    CHECK_THROWS_AS(s.set_position(1), const pgwire::not_supported&);
    CHECK(s.position() == 0);
}

TEST_CASE("seekable stream: read, rewind, re-read, dispose") {
    auto [source, conn] = make_connection(concat(sequence(10), bytes({ 200, 201, 202 })));
    auto& s = conn->open_column_stream(10, true);

    std::array<std::byte, 4> four{};
    CHECK(s.read(four) == 4);
    CHECK(four == std::array{ std::byte{ 0 }, std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 } });
    CHECK(s.position() == 4);

    CHECK(s.seek(2, pgwire::seek_origin::begin) == 2);
    std::array<std::byte, 3> three{};
    CHECK(s.read(three) == 3);
    CHECK(three == std::array{ std::byte{ 2 }, std::byte{ 3 }, std::byte{ 4 } });
    CHECK(s.position() == 5);

    s.dispose();
    CHECK(conn->read_buffer().read_position() == 10);

    auto& next = conn->open_column_stream(3, false);
    CHECK(read_all(next) == bytes({ 200, 201, 202 }));
}

TEST_CASE("seeking to every offset inside the column") {
    const auto data = sequence(12);
    auto [source, conn] = make_connection(data);

    // Consume a prefix so the column does not start at buffer position 0.
    std::array<std::byte, 2> prefix{};
    REQUIRE(conn->read_buffer().read(prefix) == 2);

    auto& s = conn->open_column_stream(8, true);
    for (std::int64_t offset = 0; offset <= 8; ++offset) {
        CAPTURE(offset);
        CHECK(s.seek(offset, pgwire::seek_origin::begin) == offset);
        CHECK(s.position() == offset);
        CHECK(conn->read_buffer().read_position() == 2 + offset);

        const auto rest = read_all(s);
        CHECK(rest == std::vector<std::byte>(data.begin() + 2 + offset, data.begin() + 10));
    }
}

TEST_CASE("seek relative to the current position and to the end") {
    auto [source, conn] = make_connection(sequence(10));
    auto& s = conn->open_column_stream(10, true);

    std::array<std::byte, 4> four{};
    CHECK(s.read(four) == 4);

    CHECK(s.seek(-1, pgwire::seek_origin::current) == 3);
    CHECK(s.read_byte() == 3);
    CHECK(s.seek(2, pgwire::seek_origin::current) == 6);
    CHECK(s.read_byte() == 6);

    CHECK(s.seek(-3, pgwire::seek_origin::end) == 7);
    CHECK(s.read_byte() == 7);
    CHECK(s.seek(0, pgwire::seek_origin::end) == 10);
    CHECK(s.read_byte() == -1);

    s.set_position(1);
    CHECK(s.position() == 1);
    CHECK(s.read_byte() == 1);
}

TEST_CASE("seeking before the start of the column") {
    auto [source, conn] = make_connection(sequence(10));
    std::array<std::byte, 3> prefix{};
    REQUIRE(conn->read_buffer().read(prefix) == 3);

    auto& s = conn->open_column_stream(5, true);
    CHECK(s.read_byte() == 3);

    CHECK_THROWS_AS(s.seek(-1, pgwire::seek_origin::begin), const pgwire::seek_before_begin&);
    CHECK_THROWS_AS(s.seek(-2, pgwire::seek_origin::current), const pgwire::seek_before_begin&);
    CHECK_THROWS_AS(s.seek(-6, pgwire::seek_origin::end), const pgwire::seek_before_begin&);
    CHECK_THROWS_AS(s.set_position(-1), const std::out_of_range&);

    // Failed seeks leave the cursor alone.
    CHECK(s.position() == 1);
    CHECK(conn->read_buffer().read_position() == 4);

    CHECK(s.seek(-1, pgwire::seek_origin::current) == 0);
    CHECK(s.seek(-5, pgwire::seek_origin::end) == 0);
}

TEST_CASE("seek offsets must fit in 31 bits") {
    auto [source, conn] = make_connection(sequence(10));
    auto& s = conn->open_column_stream(10, true);

    const std::int64_t too_big = std::int64_t{ 1 } << 31;
    CHECK_THROWS_AS(s.seek(too_big, pgwire::seek_origin::begin), const std::out_of_range&);
    CHECK_THROWS_AS(s.seek(-too_big - 1, pgwire::seek_origin::current), const std::out_of_range&);
    CHECK(s.position() == 0);
}

TEST_CASE("seeking past the end of a seekable column") {
    auto [source, conn] = make_connection(concat(sequence(5), bytes({ 50, 51, 52, 53, 54 })));
    auto& s = conn->open_column_stream(5, true);

    CHECK(s.seek(3, pgwire::seek_origin::end) == 8);
    CHECK(s.position() == 8);
    // The next column's bytes are not touched.
    CHECK(conn->read_buffer().read_position() == 5);

    std::array<std::byte, 4> buffer{};
    CHECK(s.read(buffer) == 0);
    CHECK(s.read_byte() == -1);

    s.dispose();
    CHECK(conn->read_buffer().read_position() == 5);

    auto& next = conn->open_column_stream(5, false);
    CHECK(read_all(next) == bytes({ 50, 51, 52, 53, 54 }));
}

TEST_CASE("seeking past the end of the last buffered column") {
    // Nothing follows the column: it ends exactly at the filled bytes.
    auto [source, conn] = make_connection(sequence(5));
    auto& s = conn->open_column_stream(5, true);
    REQUIRE(conn->read_buffer().filled_bytes() == 5);

    CHECK(s.seek(3, pgwire::seek_origin::end) == 8);
    CHECK(s.position() == 8);
    CHECK(s.read_byte() == -1);
    CHECK(conn->read_buffer().read_position() == 5);

    s.set_position(6);
    CHECK(s.position() == 6);
    CHECK(s.seek(-4, pgwire::seek_origin::current) == 2);
    CHECK(conn->read_buffer().read_position() == 2);
    CHECK(s.read_byte() == 2);

    CHECK(s.seek(10, pgwire::seek_origin::current) == 13);
    s.dispose();
    CHECK(conn->read_buffer().read_position() == 5);
    CHECK(conn->read_buffer().cumulative_read_position() == 5);
}

TEST_CASE("flush") {
    auto [source, conn] = make_connection(sequence(4));
    auto& s = conn->open_column_stream(4, false);

    CHECK_NOTHROW(s.flush());
    CHECK_NOTHROW(pgwire::sync_wait(s.flush_async()));

    pgwire::cancellation_source cancelled;
    cancelled.request_cancellation();
    CHECK_THROWS_AS(pgwire::sync_wait(s.flush_async(cancelled.token())), const pgwire::operation_cancelled&);
    CHECK(s.position() == 0);
}

TEST_CASE("read_async links the caller's token for the duration of the read") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(6, false);
    source->hold();

    pgwire::cancellation_source cancel;
    std::array<std::byte, 4> buffer{};
    std::size_t result = 0;

    std::thread reader{ [&] { result = pgwire::sync_wait(s.read_async(buffer, cancel.token())); } };

    while (!conn->is_in_cancellable_operation()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    source->release();
    reader.join();

    CHECK(result == 4);
    CHECK(s.position() == 4);
    CHECK(!conn->is_in_cancellable_operation());
    CHECK(!conn->user_cancellation_requested());

    // The token is no longer linked once the read completed.
    cancel.request_cancellation();
    CHECK(!conn->user_cancellation_requested());
}

TEST_CASE("read_async with an already cancelled token") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(6, false);
    source->hold();

    pgwire::cancellation_source cancel;
    cancel.request_cancellation();

    std::array<std::byte, 4> buffer{};
    CHECK_THROWS_AS(pgwire::sync_wait(s.read_async(buffer, cancel.token())), const pgwire::operation_cancelled&);

    CHECK(s.position() == 0);
    CHECK(conn->read_buffer().cumulative_read_position() == 0);
    CHECK(!conn->is_in_cancellable_operation());
    CHECK(conn->user_cancellation_requested());
}

TEST_CASE("read_async cancelled while waiting for data") {
    auto [source, conn] = make_connection(sequence(8));
    auto& s = conn->open_column_stream(6, false);
    source->hold();

    pgwire::cancellation_source cancel;
    std::array<std::byte, 4> buffer{};
    std::atomic<bool> cancelled{ false };

    std::thread reader{ [&] {
        try {
            (void)pgwire::sync_wait(s.read_async(buffer, cancel.token()));
        }
        catch (const pgwire::operation_cancelled&) {
            cancelled = true;
        }
    } };

    while (!conn->is_in_cancellable_operation()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    cancel.request_cancellation();
    reader.join();

    CHECK(cancelled);
    CHECK(s.position() == 0);
    CHECK(conn->read_buffer().cumulative_read_position() == 0);
    CHECK(!conn->is_in_cancellable_operation());
    CHECK(conn->user_cancellation_requested());

    // The column is still readable from where it was.
    source->release();
    CHECK(s.read_byte() == 0);
}

TEST_CASE("read_async without starting cancellable operations") {
    auto [source, conn] = make_connection(sequence(8), 8192, 8, false);
    auto& s = conn->open_column_stream(6, false);

    std::array<std::byte, 4> buffer{};
    CHECK(pgwire::sync_wait(s.read_async(buffer)) == 4);

    pgwire::cancellation_source cancel;
    cancel.request_cancellation();
    source->hold();
    std::array<std::byte, 1> one{};
    // Resident bytes are returned without consulting the source.
    CHECK(pgwire::sync_wait(s.read_async(one, cancel.token())) == 1);
    CHECK(!conn->user_cancellation_requested());
    CHECK(!conn->is_in_cancellable_operation());
}

TEST_SUITE_END();
