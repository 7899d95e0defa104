#include "common/result.hpp"

const char* SwapErrorName(SwapError e) {
  switch (e) {
    case SwapError::ConnectivityError: return "ConnectivityError";
    case SwapError::TokenInfoUnavailable: return "TokenInfoUnavailable";
    case SwapError::InsufficientBalance: return "InsufficientBalance";
    case SwapError::ApprovalFailed: return "ApprovalFailed";
    case SwapError::QuoteUnavailable: return "QuoteUnavailable";
    case SwapError::SubmissionFailed: return "SubmissionFailed";
    case SwapError::TransactionReverted: return "TransactionReverted";
    case SwapError::ConfirmationTimeout: return "ConfirmationTimeout";
    case SwapError::EncodingError: return "EncodingError";
    case SwapError::InvalidIntent: return "InvalidIntent";
    case SwapError::Unexpected: return "Unexpected";
  }
  return "Unknown";
}
