/**
 * @file ExportAssembler.hpp
 * @brief Single entry point that assembles a WorkoutExport for one workout.
 */

#pragma once

#include <functional>
#include <memory>
#include "application/CancellationToken.hpp"
#include "domain/WorkoutExport.hpp"
#include "domain/provider/HealthDataProvider.hpp"

namespace healthexport::application {

/**
 * @class ExportAssembler
 * @brief Runs the heart-rate and route fetches concurrently, extracts
 * statistics, events and activities inline, and joins everything into one
 * document.
 *
 * Stateless between requests: each call owns everything it creates. Either
 * fetch failing fails the whole export; no partial document is ever returned.
 */
class ExportAssembler {
public:
    using Clock = std::function<domain::Timestamp()>;

    /**
     * @param provider Data source queried by every export.
     * @param clock Source of exportDate. Defaults to the system clock at millisecond precision.
     */
    explicit ExportAssembler(std::shared_ptr<domain::HealthDataProvider> provider, Clock clock = nullptr);

    /**
     * @brief Builds the export for an already resolved workout.
     * @throws domain::ProviderError A provider query failed. If both fetches
     *         fail, the heart-rate error is thrown and the route error is logged.
     * @throws domain::ExportCancelledError @p cancellation was triggered.
     * @throws domain::UnitMismatchError The provider reported an incompatible unit.
     */
    domain::WorkoutExport buildExport(const domain::ProviderWorkout& workout,
                                      const CancellationToken& cancellation = CancellationToken());

    /**
     * @brief Resolves @p workoutId through the provider, then builds its export.
     * @throws domain::WorkoutNotFoundError The provider does not know the identifier.
     */
    domain::WorkoutExport buildExportById(const domain::WorkoutId& workoutId,
                                          const CancellationToken& cancellation = CancellationToken());

private:
    std::shared_ptr<domain::HealthDataProvider> m_provider;
    Clock m_clock;
};

} // namespace healthexport::application
