#include <cassert>
#include <chrono>
#include <iostream>

#include "application/ExportAssembler.hpp"
#include "infrastructure/DocumentSerializer.hpp"
#include "infrastructure/InMemoryHealthDataProvider.hpp"
#include "TestSupport.hpp"

using namespace healthexport;
using namespace healthexport::domain;
using namespace healthexport::test;
using healthexport::application::ExportAssembler;
using healthexport::infrastructure::DocumentSerializer;
using healthexport::infrastructure::InMemoryHealthDataProvider;

namespace {

// Every optional both present and absent somewhere in the document.
WorkoutExport MakeRichDocument() {
    WorkoutExport doc;
    doc.exportDate = At("2024-03-07T09:00:00.123Z");

    WorkoutData& w = doc.workout;
    w.type = ActivityKind::FunctionalStrength;
    w.sourceApp = "Strength Log \xC3\xA9"; // é
    w.startDate = At("2024-03-07T08:00:00Z");
    w.endDate = At("2024-03-07T08:47:30.500Z");
    w.duration = 2790.25;
    w.statistics.activeEnergyBurned = StatValue{0.0, "kcal"};
    w.statistics.averageHeartRate = StatValue{131.73333333333332, "bpm"};
    w.statistics.maxHeartRate = StatValue{168.0, "bpm"};
    w.statistics.averagePower = StatValue{212.5, "W"};

    w.heartRateSamples = {
        {At("2024-03-07T08:00:05.001Z"), 96.0},
        {At("2024-03-07T08:00:10Z"), 101.5},
    };

    RoutePoint full;
    full.latitude = 38.722345678;
    full.longitude = -9.139321;
    full.altitude = -2.75;
    full.timestamp = At("2024-03-07T08:00:01Z");
    full.horizontalAccuracy = 0.0;
    full.speed = 3.2;
    RoutePoint partial = full;
    partial.timestamp = At("2024-03-07T08:00:02.999Z");
    partial.horizontalAccuracy.reset();
    w.route = {full, partial};

    w.events = {
        {WorkoutEventKind::Segment, At("2024-03-07T08:00:00Z"), At("2024-03-07T08:10:00Z")},
        {WorkoutEventKind::Unknown, At("2024-03-07T08:11:00Z"), std::nullopt},
        {WorkoutEventKind::MotionResumed, At("2024-03-07T08:12:00Z"), std::nullopt},
    };

    ActivityData first;
    first.type = ActivityKind::FunctionalStrength;
    first.startDate = At("2024-03-07T08:00:00Z");
    first.endDate = At("2024-03-07T08:20:00Z");
    first.duration = 1200.0;
    first.statistics.averageHeartRate = StatValue{120.0, "bpm"};
    ActivityData second;
    second.type = ActivityKind::Other;
    second.startDate = At("2024-03-07T08:20:00Z");
    second.endDate = At("2024-03-07T08:47:30.500Z");
    second.duration = 1650.5;
    w.activities = {first, second};
    return doc;
}

void testRichDocumentRoundTrip() {
    DocumentSerializer serializer;
    WorkoutExport original = MakeRichDocument();

    auto encoded = serializer.serialize(original);
    WorkoutExport decoded = serializer.parse(encoded.bytes);

    assert(decoded == original);
    assert(decoded.workout.route[0].horizontalAccuracy && *decoded.workout.route[0].horizontalAccuracy == 0.0);
    assert(!decoded.workout.route[1].horizontalAccuracy);
    assert(decoded.workout.statistics.activeEnergyBurned->value == 0.0);
    assert(!decoded.workout.statistics.distance);
    assert(serializer.serialize(decoded).bytes == encoded.bytes);
    std::cout << "[PASS] Serialize -> parse reproduces the document field for field." << std::endl;
}

void testAssembledDocumentRoundTrip() {
    auto provider = std::make_shared<InMemoryHealthDataProvider>();
    auto workout = MakeRunningWorkout("RT-1");
    workout.events = {{ProviderEventType::Lap, At("2024-03-07T08:00:00Z"), At("2024-03-07T08:15:00Z")}};
    workout.activities = {{ProviderActivityType::Running, At("2024-03-07T08:00:00Z"), std::nullopt, 1800.0}};
    provider->addWorkout(workout);
    provider->addSample(QuantityKind::DistanceWalkingRunning, Sample("2024-03-07T08:10:00Z", 1.7, ProviderUnit::Mile));
    provider->addSample(QuantityKind::StepCount, Sample("2024-03-07T08:10:00Z", 4211, ProviderUnit::Count));
    provider->addSample(QuantityKind::RunningSpeed, Sample("2024-03-07T08:10:00Z", 11.3, ProviderUnit::KilometerPerHour));
    provider->addSample(QuantityKind::HeartRate, Sample("2024-03-07T08:10:00Z", 2.4, ProviderUnit::CountPerSecond));
    provider->addRoute("RT-1", {Location("2024-03-07T08:00:00Z", 38.7, -9.1, -1.0, 2.8)});

    ExportAssembler assembler(provider);
    DocumentSerializer serializer;

    WorkoutExport doc = assembler.buildExportById("RT-1");
    WorkoutExport decoded = serializer.parse(serializer.serialize(doc).bytes);
    assert(decoded == doc);
    std::cout << "[PASS] Assembled document survives a serialize/parse round trip." << std::endl;
}

void testSubMillisecondProviderTimes() {
    using std::chrono::microseconds;
    auto provider = std::make_shared<InMemoryHealthDataProvider>();
    auto workout = MakeRunningWorkout("RT-FINE");
    workout.start = workout.start + microseconds(250);
    workout.end = workout.end + microseconds(999);
    workout.events = {{ProviderEventType::Marker, workout.start + microseconds(1500), std::nullopt}};
    workout.activities = {{ProviderActivityType::Running, workout.start, std::nullopt, 600.000125}};
    provider->addWorkout(workout);

    QuantitySample sample = Sample("2024-03-07T08:05:00Z", 142, ProviderUnit::CountPerMinute);
    sample.start = sample.start + microseconds(250);
    sample.end = sample.start;
    provider->addSample(QuantityKind::HeartRate, sample);

    LocationPoint point = Location("2024-03-07T08:00:01Z", 38.7, -9.1);
    point.timestamp = point.timestamp + microseconds(42);
    provider->addRoute("RT-FINE", {point});

    ExportAssembler assembler(provider);
    DocumentSerializer serializer;

    WorkoutExport doc = assembler.buildExportById("RT-FINE");
    assert(doc.workout.heartRateSamples.size() == 1);
    assert(doc.workout.heartRateSamples[0].date == sample.start);

    auto encoded = serializer.serialize(doc);
    assert(encoded.bytes.find("\"2024-03-07T08:05:00.000250Z\"") != std::string::npos);
    assert(encoded.bytes.find("\"2024-03-07T08:00:00.000250Z\"") != std::string::npos);

    WorkoutExport decoded = serializer.parse(encoded.bytes);
    assert(decoded.workout.startDate == workout.start);
    assert(decoded.workout.heartRateSamples[0].date == sample.start);
    assert(decoded.workout.route[0].timestamp == point.timestamp);
    assert(decoded.workout.activities[0].endDate == doc.workout.activities[0].endDate);
    assert(decoded == doc);
    std::cout << "[PASS] Sub-millisecond provider timestamps survive the round trip." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Export Round-Trip Test..." << std::endl;
    testRichDocumentRoundTrip();
    testAssembledDocumentRoundTrip();
    testSubMillisecondProviderTimes();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
