#include "dal/SchemaMigrator.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace certmon::dal {

namespace {

constexpr const char* kSchemaDdl = R"sql(
CREATE TABLE IF NOT EXISTS monitored_hosts (
  id               BIGSERIAL PRIMARY KEY,
  hostname         TEXT        NOT NULL,
  zone_id          TEXT        NOT NULL DEFAULT '',
  record_id        TEXT        NOT NULL DEFAULT '',
  zone_name        TEXT        NOT NULL DEFAULT '',
  record_type      TEXT        NOT NULL DEFAULT '',
  target           TEXT        NOT NULL DEFAULT '',
  proxied          BOOLEAN     NOT NULL DEFAULT FALSE,
  comment          TEXT        NOT NULL DEFAULT '',
  is_ignored       BOOLEAN     NOT NULL DEFAULT FALSE,
  port             INTEGER     NOT NULL DEFAULT 443,
  auto_renew       BOOLEAN     NOT NULL DEFAULT FALSE,
  issuer           TEXT        NOT NULL DEFAULT '',
  not_before       TIMESTAMPTZ,
  not_after        TIMESTAMPTZ,
  days_remaining   INTEGER     NOT NULL DEFAULT 0,
  sans             JSONB       NOT NULL DEFAULT '[]'::jsonb,
  tls_version      TEXT        NOT NULL DEFAULT '',
  http_status_code INTEGER     NOT NULL DEFAULT 0,
  latency_ms       BIGINT      NOT NULL DEFAULT 0,
  is_match         BOOLEAN     NOT NULL DEFAULT FALSE,
  resolved_ips     JSONB       NOT NULL DEFAULT '[]'::jsonb,
  resolved_record  TEXT        NOT NULL DEFAULT '',
  domain_expiry    TIMESTAMPTZ,
  domain_days_left INTEGER     NOT NULL DEFAULT 0,
  last_check_at    TIMESTAMPTZ,
  last_alert_at    TIMESTAMPTZ,
  created_at       TIMESTAMPTZ NOT NULL DEFAULT NOW(),
  status           TEXT        NOT NULL DEFAULT 'pending',
  error_message    TEXT        NOT NULL DEFAULT '',
  UNIQUE (hostname, record_id)
);

CREATE INDEX IF NOT EXISTS idx_monitored_hosts_zone ON monitored_hosts (zone_name);
CREATE INDEX IF NOT EXISTS idx_monitored_hosts_status ON monitored_hosts (status);

CREATE TABLE IF NOT EXISTS alert_settings (
  id         INTEGER     PRIMARY KEY CHECK (id = 1),
  document   JSONB       NOT NULL DEFAULT '{}'::jsonb,
  updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
);
)sql";

}  // namespace

SchemaMigrator::SchemaMigrator(ConnectionPool& cpPool) : _cpPool(cpPool) {}

void SchemaMigrator::apply() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(kSchemaDdl);
  txn.commit();
  common::Logger::get()->info("Database schema verified");
}

}  // namespace certmon::dal
