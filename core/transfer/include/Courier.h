#pragma once

#include "ClientConfig.h"
#include "ErrorMapper.h"
#include "Result.h"
#include "TLSContext.h"
#include "TransferEngine.h"
#include "TransferTypes.h"
#include <functional>
#include <memory>

namespace FileCourier {

/**
 * @brief Entry point: send one file to a receiving service over TLS
 *
 * @code
 * TransferRequest request{"files.example.org", 1055, "/data/report.pdf",
 *                         DestinationUuid{"c0ffee"}};
 * auto result = Courier::sendFile(request, config);
 * if (!result) std::cerr << result.error().describe() << std::endl;
 * @endcode
 */
class Courier {
public:
    /**
     * @brief Negotiate and upload one file
     *
     * A request port of 0 falls back to config.port.
     * @param isCancelled Optional predicate polled between streamed chunks
     */
    static Result<TransferResult, TransferError> sendFile(const TransferRequest& request,
                                                          const ClientConfig& config,
                                                          std::function<bool()> isCancelled = nullptr);

    /**
     * @brief Client TLS context carrying the configured certificate and trust
     */
    static Result<std::shared_ptr<TLSContext>> createTLSContext(const ClientConfig& config);
};

} // namespace FileCourier
