#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "common/AlertSettings.hpp"

namespace certmon::common {
class IHttpClient;
}

namespace certmon::notify {

/// One outbound alert destination. send() throws common::DeliveryError on a
/// transport failure or an HTTP status >= 400.
class IAlertChannel {
 public:
  virtual ~IAlertChannel() = default;

  /// Queue key: "telegram" or "webhook".
  virtual std::string kind() const = 0;
  virtual void send(const std::string& sMessage) = 0;
};

/// Telegram Bot API sendMessage with HTML parse mode.
/// Class abbreviation: tgc
class TelegramChannel : public IAlertChannel {
 public:
  TelegramChannel(std::shared_ptr<common::IHttpClient> spHttp, std::string sBotToken,
                  std::string sChatId, std::string sApiBase = "https://api.telegram.org");

  std::string kind() const override { return "telegram"; }
  void send(const std::string& sMessage) override;

 private:
  std::shared_ptr<common::IHttpClient> _spHttp;
  std::string _sBotToken;
  std::string _sChatId;
  std::string _sApiBase;
};

/// Generic webhook: POST {"text": message}. A bearer token wins over basic auth.
/// Class abbreviation: whc
class WebhookChannel : public IAlertChannel {
 public:
  WebhookChannel(std::shared_ptr<common::IHttpClient> spHttp, std::string sUrl,
                 std::string sUser, std::string sPassword, std::string sToken);

  std::string kind() const override { return "webhook"; }
  void send(const std::string& sMessage) override;

 private:
  std::shared_ptr<common::IHttpClient> _spHttp;
  std::string _sUrl;
  std::string _sUser;
  std::string _sPassword;
  std::string _sToken;
};

/// Channels that are enabled and fully configured in als.
std::vector<std::shared_ptr<IAlertChannel>> buildChannels(
    const common::AlertSettings& als, const std::shared_ptr<common::IHttpClient>& spHttp);

}  // namespace certmon::notify
