#include "DemoApp.hpp"

#define DROP_ENTRY
#include "Entry.hpp"

extern auto Drop::make_application(const Drop::ApplicationProperties &props)
    -> Drop::Scope<Drop::App, Drop::AppDeleter> {
  return Drop::make_scope<DemoApp, Drop::AppDeleter>(props);
}
