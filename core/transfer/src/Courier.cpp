#include "Courier.h"
#include "SecureChannel.h"

namespace FileCourier {

Result<std::shared_ptr<TLSContext>> Courier::createTLSContext(const ClientConfig& config) {
    auto context = std::make_shared<TLSContext>(TLSContext::Mode::CLIENT);
    if (!context->initialize()) {
        return Error{ErrorCode::TlsInitFailed, context->getLastError()};
    }

    if (!config.certFile.empty() &&
        !context->loadCertificate(config.certFile, config.keyFile, config.keyPassword)) {
        return Error{ErrorCode::CertificateLoadFailed, context->getLastError()};
    }

    if (!config.caFile.empty()) {
        if (!context->loadCACertificates(config.caFile)) {
            return Error{ErrorCode::CertificateLoadFailed, context->getLastError()};
        }
    } else if (config.verifyPeer && !context->useSystemCertificates()) {
        return Error{ErrorCode::CertificateLoadFailed, context->getLastError()};
    }

    context->setPeerVerification(config.peerVerificationRequired());
    return context;
}

Result<TransferResult, TransferError> Courier::sendFile(const TransferRequest& request,
                                                        const ClientConfig& config,
                                                        std::function<bool()> isCancelled) {
    auto context = createTLSContext(config);
    if (!context) {
        return ErrorMapper::map(context.error());
    }

    TransferRequest effective = request;
    if (effective.port == 0) {
        effective.port = config.port;
    }

    SecureChannelFactory channels(std::move(context.value()), config.maxFrameSize, config.serverName);

    TransferEngine::Options options;
    options.chunkSize = config.chunkSize;
    options.isCancelled = std::move(isCancelled);

    TransferEngine engine(channels, FileAttributeReader(config.checksumAlgorithm), std::move(options));
    return engine.sendFile(effective);
}

} // namespace FileCourier
