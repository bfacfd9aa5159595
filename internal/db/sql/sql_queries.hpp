#pragma once

namespace credpool::db::sql {

/*
  Canonical SQL used by the SQLite and Postgres backends.

  IMPORTANT:
  Statements with parameters are rendered by credential_sql.cpp so
  placeholders match the dialect. The fragments here use only the
  subset both engines accept.
*/

// Column order is the contract for CredentialFromRow().
static constexpr const char* CREDENTIAL_COLUMNS =
    "id,file_hash,private_key,interface_ip,ipv4_address,ipv6_local,ipv6_global,endpoint,"
    "public_key,preshared_key,dns,mtu,allowed_ips,persistent_keepalive,route_table,save_config,fwmark,"
    "assignment_type,is_available,is_active,"
    "assigned_to_user_id,assigned_to_instance_id,assigned_to_username,assigned_at_ms,request_batch_id,"
    "created_at_ms,updated_at_ms";

static constexpr const char* CREDENTIAL_INSERT_COLUMNS =
    "file_hash,private_key,interface_ip,ipv4_address,ipv6_local,ipv6_global,endpoint,"
    "public_key,preshared_key,dns,mtu,allowed_ips,persistent_keepalive,route_table,save_config,fwmark,"
    "assignment_type,is_available,is_active,"
    "assigned_to_user_id,assigned_to_instance_id,assigned_to_username,assigned_at_ms,request_batch_id,"
    "created_at_ms,updated_at_ms";

static constexpr int CREDENTIAL_INSERT_COLUMN_COUNT = 26;

// batches

static constexpr const char* SELECT_BATCHES_FOR_USER_TAIL =
    " AND request_batch_id IS NOT NULL"
    " GROUP BY request_batch_id"
    " ORDER BY MIN(assigned_at_ms) DESC, request_batch_id;";

// settings

static constexpr const char* SELECT_SETTING_COLUMNS =
    "setting_key,value,description,updated_at_ms";

static constexpr const char* UPSERT_SETTING_TAIL =
    " ON CONFLICT(setting_key) DO UPDATE SET"
    " value=excluded.value,"
    " description=excluded.description,"
    " updated_at_ms=excluded.updated_at_ms;";

}
