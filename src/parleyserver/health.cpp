#include "parleyserver/health.hpp"

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include "core/version.hpp"
#include "parleyserver/ws_controller.hpp"

namespace parley {

static drogon::HttpResponsePtr make_error_response(drogon::HttpStatusCode status,
                                                   const std::string& message) {
    Json::Value body;
    body["status"] = "error";
    body["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
    resp->setStatusCode(status);
    return resp;
}

void register_health_route(const std::string& path, std::shared_ptr<Broker> broker) {
    drogon::app().registerHandler(
        path,
        [broker](const drogon::HttpRequestPtr& req,
                 std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            ConversationId conversation = 0;
            std::string param = req->getParameter("conversation");
            bool per_conversation = !param.empty();
            if (per_conversation && !parse_id(param, conversation)) {
                callback(make_error_response(drogon::k400BadRequest,
                                             "Invalid conversation parameter"));
                return;
            }

            auto cb = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(
                std::move(callback));

            bool posted = broker->stats(conversation,
                [cb, per_conversation, conversation](const BrokerStats& s) {
                    Json::Value result;
                    result["status"] = "ok";
                    result["version"] = PARLEY_VERSION;
                    result["conversations"] = static_cast<Json::UInt64>(s.conversations);
                    result["listeners"] = static_cast<Json::UInt64>(s.listeners);
                    result["messages"] = static_cast<Json::UInt64>(s.messages);
                    result["failed_deliveries"] =
                        static_cast<Json::UInt64>(s.failed_deliveries);
                    if (per_conversation) {
                        Json::Value conv;
                        conv["id"] = static_cast<Json::UInt64>(conversation);
                        conv["active"] = s.has_conversation;
                        conv["listeners"] =
                            static_cast<Json::UInt64>(s.conversation_listeners);
                        result["conversation"] = std::move(conv);
                    }
                    (*cb)(drogon::HttpResponse::newHttpJsonResponse(std::move(result)));
                });

            if (!posted) {
                (*cb)(make_error_response(drogon::k503ServiceUnavailable,
                                          "Broker is shutting down"));
            }
        },
        {drogon::Get});
}

} // namespace parley
