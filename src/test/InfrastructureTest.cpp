#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "application/ExportAssembler.hpp"
#include "infrastructure/DocumentSerializer.hpp"
#include "infrastructure/ExportWriter.hpp"
#include "infrastructure/ProviderSnapshotLoader.hpp"
#include "infrastructure/SettingsLoader.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;

using namespace healthexport;
using namespace healthexport::domain;
using namespace healthexport::test;
using namespace healthexport::infrastructure;
using healthexport::application::ExportAssembler;

namespace {

const char* kSnapshot = R"({
  "workouts": [{
    "id": "9F1C2B7A-0D4E-4C55-8B7E-2A1F0C3D4E5F",
    "activityType": 37,
    "sourceName": "Workout",
    "start": "2024-03-07T08:15:00Z",
    "end": "2024-03-07T08:45:00Z",
    "duration": 1795.5,
    "events": [{ "type": 1, "start": "2024-03-07T08:20:00Z" },
               { "type": 2, "start": "2024-03-07T08:21:00Z" }],
    "activities": [{ "activityType": 50, "start": "2024-03-07T08:15:00Z", "duration": 600 }]
  }],
  "samples": [
    { "kind": "heartRate", "start": "2024-03-07T08:16:00Z", "value": 130, "unit": "count/min" },
    { "kind": "heartRate", "start": "2024-03-07T10:17:00+02:00", "value": 150, "unit": "count/min" },
    { "kind": "distanceWalkingRunning", "start": "2024-03-07T08:30:00Z", "value": 4.5, "unit": "km" }
  ],
  "routes": [{
    "workoutId": "9F1C2B7A-0D4E-4C55-8B7E-2A1F0C3D4E5F",
    "points": [{ "latitude": 38.72, "longitude": -9.14, "altitude": 40, "timestamp": "2024-03-07T08:15:05Z",
                 "horizontalAccuracy": 4.0 }]
  }]
})";

fs::path FreshDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void testIsoDateTime() {
    assert(IsoDateTime::Parse("2024-03-07T10:15:00+02:00") == IsoDateTime::Parse("2024-03-07T08:15:00Z"));
    assert(IsoDateTime::Parse("2024-03-07T08:15:00-00:30") == IsoDateTime::Parse("2024-03-07T08:45:00Z"));
    assert(IsoDateTime::Format(IsoDateTime::Parse("2024-03-07T08:15:00.5Z")) == "2024-03-07T08:15:00.500Z");
    assert(IsoDateTime::Format(IsoDateTime::Parse("1970-01-01T00:00:00Z")) == "1970-01-01T00:00:00Z");
    assert(IsoDateTime::Format(IsoDateTime::Parse("2024-02-29T23:59:59Z")) == "2024-02-29T23:59:59Z");
    assert(IsoDateTime::FormatDay(IsoDateTime::Parse("2024-03-07T23:59:59Z"), false) == "2024-03-07");

    const Timestamp base = IsoDateTime::Parse("2024-03-07T08:05:00Z");
    const Timestamp micros = base + std::chrono::microseconds(250);
    assert(IsoDateTime::Format(micros) == "2024-03-07T08:05:00.000250Z");
    assert(IsoDateTime::Parse(IsoDateTime::Format(micros)) == micros);
    const Timestamp finest = IsoDateTime::Parse("2024-03-07T08:05:00.123456789Z");
    assert(IsoDateTime::Parse(IsoDateTime::Format(finest)) == finest);

    const Timestamp beforeEpoch = IsoDateTime::Parse("1969-12-31T23:59:59.500Z");
    assert(IsoDateTime::Format(beforeEpoch) == "1969-12-31T23:59:59.500Z");
    assert(IsoDateTime::FormatDay(beforeEpoch, false) == "1969-12-31");
    assert(Throws<std::invalid_argument>([] { IsoDateTime::Parse("2024-03-07"); }));
    assert(Throws<std::invalid_argument>([] { IsoDateTime::Parse("2024-13-07T08:15:00Z"); }));
    assert(Throws<std::invalid_argument>([] { IsoDateTime::Parse("2024-03-07T08:15:00"); }));
    std::cout << "[PASS] ISO-8601 parse/format with offsets, sub-millisecond fractions and pre-1970 days." << std::endl;
}

void testSnapshotDrivesExport() {
    auto provider = ProviderSnapshotLoader::LoadString(kSnapshot);
    assert(provider->workoutCount() == 1);

    ExportAssembler assembler(provider, [] { return At("2024-03-07T12:00:00Z"); });
    WorkoutExport doc = assembler.buildExportById("9F1C2B7A-0D4E-4C55-8B7E-2A1F0C3D4E5F");

    assert(doc.workout.type == ActivityKind::Running);
    assert(doc.workout.duration == 1795.5);
    assert(doc.workout.heartRateSamples.size() == 2);
    assert(doc.workout.heartRateSamples[1].date == At("2024-03-07T08:17:00Z"));
    assert(doc.workout.statistics.distance && Near(doc.workout.statistics.distance->value, 4.5));
    assert(doc.workout.events.size() == 2);
    assert(doc.workout.events[1].type == WorkoutEventKind::Resume);
    assert(doc.workout.activities.size() == 1);
    assert(doc.workout.activities[0].type == ActivityKind::StrengthTraining);
    assert(doc.workout.activities[0].endDate == At("2024-03-07T08:25:00Z"));
    assert(doc.workout.route.size() == 1);
    assert(!doc.workout.route[0].speed);
    assert(doc.workout.route[0].horizontalAccuracy && *doc.workout.route[0].horizontalAccuracy == 4.0);

    DocumentSerializer serializer;
    assert(serializer.serialize(doc).filename == "workout-running-2024-03-07.json");
    std::cout << "[PASS] Snapshot-backed provider drives a full export." << std::endl;
}

void testBadSnapshots() {
    assert(Throws<SnapshotError>([] { ProviderSnapshotLoader::LoadString("{ not json"); }));
    assert(Throws<SnapshotError>([] {
        ProviderSnapshotLoader::LoadString(R"({"samples": [{"kind": "vo2Max", "start": "2024-03-07T08:00:00Z", "value": 1, "unit": "count"}]})");
    }));
    assert(Throws<SnapshotError>([] {
        ProviderSnapshotLoader::LoadString(R"({"samples": [{"kind": "heartRate", "start": "2024-03-07T08:00:00Z", "value": 1, "unit": "furlong"}]})");
    }));
    assert(Throws<SnapshotError>([] {
        ProviderSnapshotLoader::LoadString(R"({"workouts": [{"id": "x", "activityType": 37, "start": "noon", "end": "2024-03-07T08:00:00Z"}]})");
    }));
    assert(Throws<SnapshotError>([] { ProviderSnapshotLoader::LoadFile("/nonexistent/healthexport/snapshot.json"); }));
    std::cout << "[PASS] Malformed snapshots -> SnapshotError." << std::endl;
}

void testSnapshotFromFile() {
    fs::path dir = FreshDir("healthexport_snapshot_test");
    fs::path path = dir / "snapshot.json";
    {
        std::ofstream out(path);
        out << kSnapshot;
    }
    auto provider = ProviderSnapshotLoader::LoadFile(path.string());
    assert(provider->findWorkout("9F1C2B7A-0D4E-4C55-8B7E-2A1F0C3D4E5F"));
    fs::remove_all(dir);
    std::cout << "[PASS] Snapshot loads from file." << std::endl;
}

void testExportWriter() {
    fs::path dir = FreshDir("healthexport_writer_test") / "nested" / "exports";

    SerializedDocument document{"{\n  \"exportVersion\": \"1.0\"\n}", "workout-running-2024-03-07.json"};
    fs::path written = ExportWriter::Write(document, dir);

    assert(written == dir / "workout-running-2024-03-07.json");
    assert(ReadAll(written) == document.bytes);

    // Overwrite in place; no temp files left behind.
    document.bytes = "{}";
    ExportWriter::Write(document, dir);
    assert(ReadAll(written) == "{}");
    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);

    SerializedDocument unnamed{"{}", ""};
    assert(Throws<ExportIoError>([&] { ExportWriter::Write(unnamed, dir); }));

    fs::remove_all(fs::temp_directory_path() / "healthexport_writer_test");
    std::cout << "[PASS] ExportWriter writes atomically and creates the directory." << std::endl;
}

void testSettingsLoader() {
    fs::path dir = FreshDir("healthexport_settings_test");

    ExportSettings missing = SettingsLoader::Load(dir / "absent.json");
    assert(missing.serializer.indent == 2);
    assert(missing.serializer.filenameTimeZone == FilenameTimeZone::Utc);
    assert(missing.outputDir == SettingsLoader::Defaults().outputDir);

    fs::path path = dir / "settings.json";
    {
        std::ofstream out(path);
        out << R"({"output_dir": "/tmp/he-out", "filename_timezone": "local", "indent": 4})";
    }
    ExportSettings custom = SettingsLoader::Load(path);
    assert(custom.outputDir == fs::path("/tmp/he-out"));
    assert(custom.serializer.filenameTimeZone == FilenameTimeZone::Local);
    assert(custom.serializer.indent == 4);

    {
        std::ofstream out(path);
        out << R"({"filename_timezone": "mars", "indent": 40})";
    }
    ExportSettings invalid = SettingsLoader::Load(path);
    assert(invalid.serializer.filenameTimeZone == FilenameTimeZone::Utc);
    assert(invalid.serializer.indent == 2);

    {
        std::ofstream out(path);
        out << R"({"indent": 0})";
    }
    assert(SettingsLoader::Load(path).serializer.indent == 2);

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    ExportSettings broken = SettingsLoader::Load(path);
    assert(broken.serializer.indent == 2);

    fs::remove_all(dir);
    std::cout << "[PASS] SettingsLoader reads overrides and falls back to defaults." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Infrastructure Test..." << std::endl;
    testIsoDateTime();
    testSnapshotDrivesExport();
    testBadSnapshots();
    testSnapshotFromFile();
    testExportWriter();
    testSettingsLoader();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
