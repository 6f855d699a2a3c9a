#ifndef ALLHANDLERS_H
#define ALLHANDLERS_H

// Include all tool handlers
#include "SelectionToolHandler.h"
#include "ArrowToolHandler.h"
#include "PencilToolHandler.h"
#include "ShapeToolHandler.h"
#include "TextToolHandler.h"

#endif // ALLHANDLERS_H
