#pragma once

/**
 * nrx - on-device LLM engine
 *
 * Classifies the device, picks the best local inference backend
 * (platform foundation model, embedded llama.cpp, or none) and manages
 * its lifecycle and model download.
 */

#include <nrx/result.hpp>
#include <nrx/config.hpp>
#include <nrx/llm/device_classifier.hpp>
#include <nrx/llm/model_catalog.hpp>
#include <nrx/llm/provider.hpp>
#include <nrx/llm/provider_manager.hpp>
