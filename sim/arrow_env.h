#pragma once
#ifndef _ARROW_ENV_H_
#define _ARROW_ENV_H_
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/feather.h>
#endif
