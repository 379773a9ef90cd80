#pragma once

#include <Poco/Exception.h>
#include <Poco/Net/HTTPResponse.h>

// Error taxonomy for request handling. Everything the handlers can reject
// derives from LeakException so the router can map it to a status in one place.
POCO_DECLARE_EXCEPTION(, LeakException, Poco::Exception)
POCO_DECLARE_EXCEPTION(, PathEscapeException, LeakException)
POCO_DECLARE_EXCEPTION(, ResourceNotFoundException, LeakException)
POCO_DECLARE_EXCEPTION(, BadRequestException, LeakException)
POCO_DECLARE_EXCEPTION(, PayloadTooLargeException, LeakException)
POCO_DECLARE_EXCEPTION(, UnauthorizedException, LeakException)
POCO_DECLARE_EXCEPTION(, InternalFailureException, LeakException)

Poco::Net::HTTPResponse::HTTPStatus statusFor(const LeakException& e);
