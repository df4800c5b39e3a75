#include <catch2/catch_test_macros.hpp>

#include "network/stdio_core_link.hpp"
#include "wait_until.hpp"

#include <QBuffer>
#include <QJsonDocument>
#include <QJsonObject>
#include <unistd.h>
#include <variant>
#include <vector>

using namespace tether;
using namespace tether::network;

namespace {

struct Recorder {
    std::vector<events::CoreEvent> events;
    int closed = 0;

    void attach(StdioCoreLink& link) {
        link.on_event = [this](events::CoreEvent event) { events.push_back(std::move(event)); };
        link.on_closed = [this] { ++closed; };
    }
};

} // namespace

TEST_CASE("StdioCoreLink: lines split across chunks", "[integration][link]") {
    StdioCoreLink link(-1, nullptr);
    Recorder recorder;
    recorder.attach(link);

    link.feed(R"({"event":"connected","deviceId":"dev1","device":{"name":"Pix)");
    REQUIRE(recorder.events.empty());

    link.feed("el\"}}\n{\"event\":\"disconnected\",");
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(std::get<events::Connected>(recorder.events[0]).device.name == QStringLiteral("Pixel"));

    link.feed("\"deviceId\":\"dev1\"}\n");
    REQUIRE(recorder.events.size() == 2);
    REQUIRE(std::holds_alternative<events::Disconnected>(recorder.events[1]));
    REQUIRE(link.droppedLines() == 0);
}

TEST_CASE("StdioCoreLink: malformed lines are skipped", "[integration][link]") {
    StdioCoreLink link(-1, nullptr);
    Recorder recorder;
    recorder.attach(link);

    link.feed("not json\n");
    link.feed("\n   \n");
    link.feed(R"({"event":"teleport","deviceId":"dev1"})" "\n");
    link.feed(R"({"event":"clipboard","content":"still here"})" "\n");

    REQUIRE(link.droppedLines() == 2);
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(std::get<events::ClipboardReceived>(recorder.events[0]).content == QStringLiteral("still here"));
}

TEST_CASE("StdioCoreLink: finish flushes the last line and closes once", "[integration][link]") {
    StdioCoreLink link(-1, nullptr);
    Recorder recorder;
    recorder.attach(link);

    link.feed(R"({"event":"disconnected","deviceId":"dev1"})");
    REQUIRE(recorder.events.empty());

    link.finish();
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.closed == 1);
    REQUIRE(link.isFinished());

    link.finish();
    link.feed(R"({"event":"disconnected","deviceId":"dev2"})" "\n");
    REQUIRE(recorder.closed == 1);
    REQUIRE(recorder.events.size() == 1);
}

TEST_CASE("StdioCoreLink: start needs an input descriptor", "[integration][link]") {
    StdioCoreLink link(-1, nullptr);
    const auto started = link.start();
    REQUIRE(started.is_err());
    REQUIRE(started.unwrap_err().is(ErrorCode::NotInitialized));
}

TEST_CASE("StdioCoreLink: send writes one json line", "[integration][link]") {
    QBuffer buffer;
    REQUIRE(buffer.open(QIODevice::ReadWrite));
    StdioCoreLink link(-1, &buffer);

    const commands::Request request{DeviceId(QStringLiteral("dev1")), commands::Ping{QStringLiteral("hi")}};
    REQUIRE(link.send(request).is_ok());

    const QByteArray written = buffer.data();
    REQUIRE(written.endsWith('\n'));
    REQUIRE(written.count('\n') == 1);

    const auto obj = QJsonDocument::fromJson(written.trimmed()).object();
    REQUIRE(obj.value(QStringLiteral("deviceId")).toString() == QStringLiteral("dev1"));
    REQUIRE(obj.value(QStringLiteral("type")).toString() == QStringLiteral("kdeconnect.ping"));
    REQUIRE(obj.value(QStringLiteral("body")).toObject().value(QStringLiteral("message")).toString() == QStringLiteral("hi"));
}

TEST_CASE("StdioCoreLink: send without output fails", "[integration][link]") {
    StdioCoreLink link(-1, nullptr);
    const auto sent = link.send(commands::Request{DeviceId(QStringLiteral("dev1")), commands::Pair{}});
    REQUIRE(sent.is_err());
    REQUIRE(sent.unwrap_err().is(ErrorCode::NotInitialized));
}

TEST_CASE("StdioCoreLink: reads a pipe until end of input", "[integration][link]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    StdioCoreLink link(fds[0], nullptr);
    Recorder recorder;
    recorder.attach(link);
    REQUIRE(link.start().is_ok());

    const QByteArray lines =
        R"({"event":"connected","deviceId":"dev1","device":{"name":"Pixel"}})" "\n"
        R"({"event":"pairState","deviceId":"dev1","state":"requested"})" "\n";
    REQUIRE(::write(fds[1], lines.constData(), static_cast<size_t>(lines.size())) == lines.size());
    ::close(fds[1]);

    REQUIRE(waitUntil([&] { return recorder.closed == 1; }));
    REQUIRE(recorder.events.size() == 2);
    REQUIRE(std::holds_alternative<events::PairStateChanged>(recorder.events[1]));

    ::close(fds[0]);
}
