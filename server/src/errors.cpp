#include "errors.hpp"

POCO_IMPLEMENT_EXCEPTION(LeakException, Poco::Exception, "Request failed")
POCO_IMPLEMENT_EXCEPTION(PathEscapeException, LeakException, "Path outside root")
POCO_IMPLEMENT_EXCEPTION(ResourceNotFoundException, LeakException, "Not found")
POCO_IMPLEMENT_EXCEPTION(BadRequestException, LeakException, "Bad request")
POCO_IMPLEMENT_EXCEPTION(PayloadTooLargeException, LeakException, "Payload too large")
POCO_IMPLEMENT_EXCEPTION(UnauthorizedException, LeakException, "Unauthorized")
POCO_IMPLEMENT_EXCEPTION(InternalFailureException, LeakException, "Internal failure")

using Poco::Net::HTTPResponse;

HTTPResponse::HTTPStatus statusFor(const LeakException& e) {
    if (dynamic_cast<const PathEscapeException*>(&e))       return HTTPResponse::HTTP_FORBIDDEN;
    if (dynamic_cast<const ResourceNotFoundException*>(&e)) return HTTPResponse::HTTP_NOT_FOUND;
    if (dynamic_cast<const BadRequestException*>(&e))       return HTTPResponse::HTTP_BAD_REQUEST;
    if (dynamic_cast<const PayloadTooLargeException*>(&e))  return HTTPResponse::HTTP_REQUEST_ENTITY_TOO_LARGE;
    if (dynamic_cast<const UnauthorizedException*>(&e))     return HTTPResponse::HTTP_UNAUTHORIZED;
    return HTTPResponse::HTTP_INTERNAL_SERVER_ERROR;
}
