#include "connector/processors/dispatch/DispatchRequestProcessor.hpp"
#include "logger/Logger.hpp"

namespace connector::processors::dispatch {
    DispatchRequestProcessor::DispatchRequestProcessor(::dispatch::DispatchQueue &queue) : queue_(queue) {
    }

    nlohmann::json DispatchRequestProcessor::process(const models::dispatch::DispatchRequest &request) {
        nlohmann::json reply{
            {"requestId", request.requestId},
            {"action", request.action},
            {"accepted", false}
        };

        if (!request.isValid()) {
            reply["error"] = "Invalid " + request.action + " request";
            return reply;
        }

        if (request.action == "state") {
            reply["accepted"] = true;
            reply["state"] = queue_.state();
            return reply;
        }

        if (request.action == "cancel") {
            const auto result = queue_.cancel(*request.jobId);
            reply["accepted"] = result.cancelled;
            reply["result"] = result.toJson();
            return reply;
        }

        try {
            const auto result = request.action == "reprint_archive"
                                    ? queue_.dispatchReprintArchive(request.sourceId, request.sourceName,
                                                                    request.printerId, request.printerName,
                                                                    request.options, request.requesterId,
                                                                    request.requesterName)
                                    : queue_.dispatchPrintLibraryFile(request.sourceId, request.sourceName,
                                                                      request.printerId, request.printerName,
                                                                      request.options, request.requesterId,
                                                                      request.requesterName);
            reply["accepted"] = true;
            reply["jobId"] = result.jobId;
            reply["position"] = result.position;
        } catch (const ::dispatch::DispatchRejected &e) {
            Logger::logInfo("[DispatchRequestProcessor] Rejected " + request.action + ": " + e.what());
            reply["error"] = e.what();
        }
        return reply;
    }
}
