#pragma once

#include <paulette/schema/app_info.hpp>
#include <paulette/schema/primitives.hpp>
#include <paulette/schema/query_result.hpp>
#include <paulette/schema/transaction_result.hpp>
#include <paulette/v1/office_ledger.pb.h>
#include <paulette/v1/types.pb.h>
#include <optional>
#include <string>

// Mapping between schema values and their protobuf wire form.
namespace paulette::rpc {

void to_proto(const paulette::schema::signer_id_t& signer,
              paulette::v1::Identity* identity);

std::optional<paulette::schema::signer_id_t> try_from_proto(
    const paulette::v1::Identity& identity);

std::string to_proto(const paulette::schema::hash32_t& hash);

/// Accepts exactly 32 raw bytes.
std::optional<paulette::schema::hash32_t> try_hash32_from_proto(
    const std::string& bytes);

void to_proto(const paulette::schema::transaction_result_t& result,
              paulette::v1::SubmitResponse* response);

void to_proto(const paulette::schema::query_result_t& result,
              paulette::v1::QueryResponse* response);

void to_proto(const paulette::schema::app_info_t& info,
              paulette::v1::InfoResponse* response);

}  // namespace paulette::rpc
