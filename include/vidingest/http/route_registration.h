#pragma once

#include <memory>

#include "vidingest/http/router.h"

namespace vidingest::upload {
class SessionManager;
}

namespace vidingest::http {

/// Registers health, metrics and upload routes into the provided router.
void RegisterUploadRoutes(Router& router, std::shared_ptr<upload::SessionManager> sessions);

}  // namespace vidingest::http
