/**
 * @file
 * @brief Convenience include for every AST node type.
 */
#pragma once

#include "ast/Node.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"
#include "ast/Literal.h"
#include "ast/VariableRef.h"
#include "ast/Call.h"
#include "ast/Unary.h"
#include "ast/Binary.h"
#include "ast/LineStmt.h"
#include "ast/OptionItem.h"
#include "ast/OptionGroup.h"
#include "ast/SetStmt.h"
#include "ast/DeclareStmt.h"
#include "ast/IfStmt.h"
#include "ast/JumpStmt.h"
#include "ast/StopStmt.h"
#include "ast/CommandStmt.h"
#include "ast/NodeDecl.h"
#include "ast/File.h"
