#ifndef SHEETCALC_SHEETCALC_H
#define SHEETCALC_SHEETCALC_H

#include "sheetcalc/CAddressStore.h"
#include "sheetcalc/CCell.h"
#include "sheetcalc/CCellStyle.h"
#include "sheetcalc/CCommand.h"
#include "sheetcalc/CDispatchChannel.h"
#include "sheetcalc/CEngineLimits.h"
#include "sheetcalc/CEvaluator.h"
#include "sheetcalc/CExprBuilder.h"
#include "sheetcalc/CFormulaParser.h"
#include "sheetcalc/CFuncCall.h"
#include "sheetcalc/CFunctionRegistry.h"
#include "sheetcalc/CGridContext.h"
#include "sheetcalc/CLiterals.h"
#include "sheetcalc/CMyExpressionBuilder.h"
#include "sheetcalc/COperation.h"
#include "sheetcalc/COperators.h"
#include "sheetcalc/CPos.h"
#include "sheetcalc/CRangeResolver.h"
#include "sheetcalc/CReference.h"
#include "sheetcalc/CReferenceAdjuster.h"
#include "sheetcalc/CSpreadsheet.h"
#include "sheetcalc/CTokenizer.h"
#include "sheetcalc/CUndoStack.h"
#include "sheetcalc/CValue.h"

#endif /* SHEETCALC_SHEETCALC_H */
