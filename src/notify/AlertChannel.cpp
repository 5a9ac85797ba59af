#include "notify/AlertChannel.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/HttpClient.hpp"

namespace certmon::notify {

namespace {

constexpr std::chrono::milliseconds kSendTimeout{10000};

void post(common::IHttpClient& hc, common::HttpRequest hreq, const std::string& sChannel) {
  hreq.sMethod = "POST";
  hreq.durTimeout = kSendTimeout;
  hreq.vHeaders.emplace_back("Content-Type", "application/json");

  common::HttpResponse hres;
  try {
    hres = hc.send(hreq);
  } catch (const common::ConnectionError& e) {
    throw common::DeliveryError(sChannel + "_unreachable", sChannel + ": " + e.what());
  }
  if (hres.iStatus >= 400) {
    throw common::DeliveryError(sChannel + "_rejected",
                                sChannel + " status code " + std::to_string(hres.iStatus));
  }
}

}  // namespace

TelegramChannel::TelegramChannel(std::shared_ptr<common::IHttpClient> spHttp,
                                 std::string sBotToken, std::string sChatId,
                                 std::string sApiBase)
    : _spHttp(std::move(spHttp)),
      _sBotToken(std::move(sBotToken)),
      _sChatId(std::move(sChatId)),
      _sApiBase(std::move(sApiBase)) {}

void TelegramChannel::send(const std::string& sMessage) {
  common::HttpRequest hreq;
  hreq.sUrl = _sApiBase + "/bot" + _sBotToken + "/sendMessage";
  hreq.sBody = nlohmann::json{{"chat_id", _sChatId}, {"text", sMessage}, {"parse_mode", "HTML"}}
                   .dump();
  post(*_spHttp, std::move(hreq), "telegram");
}

WebhookChannel::WebhookChannel(std::shared_ptr<common::IHttpClient> spHttp, std::string sUrl,
                               std::string sUser, std::string sPassword, std::string sToken)
    : _spHttp(std::move(spHttp)),
      _sUrl(std::move(sUrl)),
      _sUser(std::move(sUser)),
      _sPassword(std::move(sPassword)),
      _sToken(std::move(sToken)) {}

void WebhookChannel::send(const std::string& sMessage) {
  common::HttpRequest hreq;
  hreq.sUrl = _sUrl;
  hreq.sBody = nlohmann::json{{"text", sMessage}}.dump();
  if (!_sToken.empty()) {
    hreq.vHeaders.emplace_back("Authorization", "Bearer " + _sToken);
  } else {
    hreq.sBasicUser = _sUser;
    hreq.sBasicPassword = _sPassword;
  }
  post(*_spHttp, std::move(hreq), "webhook");
}

std::vector<std::shared_ptr<IAlertChannel>> buildChannels(
    const common::AlertSettings& als, const std::shared_ptr<common::IHttpClient>& spHttp) {
  std::vector<std::shared_ptr<IAlertChannel>> vChannels;
  if (als.bTelegramEnabled && !als.sTelegramBotToken.empty() && !als.sTelegramChatId.empty()) {
    vChannels.push_back(
        std::make_shared<TelegramChannel>(spHttp, als.sTelegramBotToken, als.sTelegramChatId));
  }
  if (als.bWebhookEnabled && !als.sWebhookUrl.empty()) {
    vChannels.push_back(std::make_shared<WebhookChannel>(
        spHttp, als.sWebhookUrl, als.sWebhookUser, als.sWebhookPassword, als.sWebhookToken));
  }
  return vChannels;
}

}  // namespace certmon::notify
